#include "chain.h"
#include <cstdlib>

namespace custody
{
	static string index_storage_configuration(storage_optimization type, uint64_t index_page_size, int64_t index_cache_size)
	{
		switch (type)
		{
			case custody::storage_optimization::speed:
				return stringify::text(
					"PRAGMA journal_mode = WAL;"
					"PRAGMA synchronous = off;"
					"PRAGMA temp_store = memory;"
					"PRAGMA busy_timeout = 10000;"
					"PRAGMA page_size = %" PRIu64 ";"
					"PRAGMA cache_size = %" PRIi64 ";", index_page_size, index_cache_size);
			case custody::storage_optimization::safety:
			default:
				return stringify::text(
					"PRAGMA journal_mode = WAL;"
					"PRAGMA synchronous = normal;"
					"PRAGMA temp_store = file;"
					"PRAGMA busy_timeout = 10000;"
					"PRAGMA page_size = %" PRIu64 ";"
					"PRAGMA cache_size = %" PRIi64 ";", index_page_size, index_cache_size);
		}
	}
	static option<decimal> config_decimal(schema* value)
	{
		if (value == nullptr)
			return optional::none;

		if (value->value.is(var_type::string))
		{
			decimal result = decimal(std::string_view(value->value.get_blob()));
			if (result.is_nan())
				return optional::none;
			return result;
		}
		else if (value->value.is(var_type::integer) || value->value.is(var_type::number) || value->value.is(var_type::decimal))
			return value->value.get_decimal();

		return optional::none;
	}
	static string upper_of(const std::string_view& value)
	{
		string result = string(value);
		stringify::to_upper(result);
		return result;
	}
	static const char* environment_of(const std::string_view& chain, const std::string_view& name)
	{
		string key = upper_of(stringify::text("%.*s_%.*s", (int)chain.size(), chain.data(), (int)name.size(), name.data()));
		const char* value = std::getenv(key.c_str());
		return value != nullptr && *value != '\0' ? value : nullptr;
	}

	layer_exception::layer_exception() : std::exception()
	{
	}
	layer_exception::layer_exception(string&& text) : std::exception(), error_message(std::move(text))
	{
	}
	const char* layer_exception::what() const noexcept
	{
		return error_message.c_str();
	}
	string&& layer_exception::message() noexcept
	{
		return std::move(error_message);
	}
	layer_exception layer_exception::insufficient_funds(const std::string_view& details)
	{
		return layer_exception(stringify::text("insufficient funds: %.*s", (int)details.size(), details.data()));
	}
	layer_exception layer_exception::precision_exceeded(const std::string_view& details)
	{
		return layer_exception(stringify::text("precision exceeded: %.*s", (int)details.size(), details.data()));
	}
	layer_exception layer_exception::unsupported_chain(const std::string_view& chain)
	{
		return layer_exception(stringify::text("unsupported chain: %.*s", (int)chain.size(), chain.data()));
	}
	layer_exception layer_exception::invalid_address(const std::string_view& details)
	{
		return layer_exception(stringify::text("invalid address: %.*s", (int)details.size(), details.data()));
	}

	remote_exception::remote_exception(int8_t new_status) : std::exception(), error_status(new_status)
	{
	}
	remote_exception::remote_exception(string&& text) : std::exception(), error_message(std::move(text)), error_status(0)
	{
	}
	const char* remote_exception::what() const noexcept
	{
		if (!error_message.empty())
			return error_message.c_str();
		else if (error_status > 0)
			return "retry again later (minor failure)";
		else if (error_status < 0)
			return "retry again later (major failure)";
		return error_message.c_str();
	}
	string&& remote_exception::message() noexcept
	{
		if (error_message.empty() && error_status > 0)
			error_message = "retry again later (minor failure)";
		else if (error_message.empty() && error_status < 0)
			error_message = "retry again later (major failure)";
		return std::move(error_message);
	}
	bool remote_exception::is_retry() const noexcept
	{
		return error_status > 0;
	}
	bool remote_exception::is_shutdown() const noexcept
	{
		return error_status < 0;
	}
	remote_exception remote_exception::retry()
	{
		return remote_exception(1);
	}
	remote_exception remote_exception::shutdown()
	{
		return remote_exception(-1);
	}
	remote_exception remote_exception::transient(string&& text)
	{
		remote_exception result = remote_exception(1);
		result.error_message = std::move(text);
		return result;
	}

	repository::repository(protocol* new_owner) noexcept : owner(new_owner)
	{
	}
	uref<sqlite::connection> repository::pull_index(const std::string_view& location, std::function<void(sqlite::connection*)>&& initializer)
	{
		umutex<std::mutex> unique(mutex);
		auto& storage = owner->user.storage;
		if (target_path.empty())
			resolve(owner->user.network, storage.path);

		uref<sqlite::connection> result;
		string address = stringify::text("file:///%s%.*s.db", target_path.c_str(), (int)location.size(), location.data());
		auto& queue = indices[address];
		if (!queue.empty())
		{
			result = std::move(queue.front());
			queue.pop();
			return result;
		}

		result = new sqlite::connection();
		auto status = result->connect(address);
		if (!status)
		{
			if (storage.logging)
				VI_ERR("index open error: %s (location: %s)", status.error().what(), address.c_str());

			return uref<sqlite::connection>();
		}

		if (!result->query(index_storage_configuration(storage.optimization, storage.index_page_size, storage.index_cache_size)))
			return uref<sqlite::connection>();

		if (initializer)
			initializer(*result);

		if (storage.logging)
			VI_DEBUG("index open on %s (handle: 0x%" PRIXPTR ")", address.c_str(), (uintptr_t)*result);

		return result;
	}
	void repository::push_index(uref<sqlite::connection>&& value)
	{
		VI_ASSERT(value, "connection should be set");
		if (value->get_ref_count() > 1)
			return value.destroy();

		umutex<std::mutex> unique(mutex);
		auto& queue = indices[value->get_address()];
		queue.push(std::move(value));
	}
	void repository::reset()
	{
		umutex<std::mutex> unique(mutex);
		indices.clear();
		target_path.clear();
	}
	void repository::checkpoint()
	{
		umutex<std::mutex> unique(mutex);
		for (auto& queue : indices)
		{
			if (queue.second.empty())
				continue;

			auto& handle = queue.second.front();
			auto states = handle->wal_checkpoint(sqlite::checkpoint_mode::truncate);
			if (owner->user.storage.logging)
			{
				for (auto& state : states)
					VI_INFO("index storage checkpoint on %s (db: %s, fc: %i, fs: %i, stat: %i)", queue.first.c_str(), state.database.empty() ? "all" : state.database.c_str(), state.frames_count, state.frames_size, state.status);
			}
		}
	}
	const string& repository::resolve(network_type type, const std::string_view& path)
	{
		if (!target_path.empty())
			return target_path;

		auto module_path = os::directory::get_module();
		if (!module_path->empty() && module_path->back() != '/' && module_path->back() != '\\')
			*module_path += VI_SPLITTER;

		auto absolute_path = os::path::resolve(path, *module_path, true);
		string base_path = absolute_path ? *absolute_path : *module_path + string(path);
		if (!base_path.empty() && base_path.back() != '/' && base_path.back() != '\\')
			base_path += VI_SPLITTER;

		switch (type)
		{
			case network_type::regtest:
				base_path += "regtest";
				break;
			case network_type::testnet:
				base_path += "testnet";
				break;
			case network_type::mainnet:
				base_path += "mainnet";
				break;
			default:
				VI_PANIC(false, "invalid network type");
				break;
		}

		base_path += VI_SPLITTER;
		auto resolved_path = os::path::resolve(base_path);
		VI_PANIC(resolved_path && os::directory::patch(*resolved_path), "invalid storage path: %s", base_path.c_str());
		target_path = std::move(*resolved_path);
		if (!target_path.empty() && target_path.back() != '/' && target_path.back() != '\\')
			target_path += VI_SPLITTER;
		return target_path;
	}
	const string repository::location() const
	{
		return target_path;
	}
	const protocol& repository::params() const
	{
		return *owner;
	}

	void protocol::logger::output(const std::string_view& message)
	{
		if (!resource || message.empty())
			return;

		time_t time = ::time(nullptr);
		umutex<std::recursive_mutex> unique(mutex);
		resource->write((uint8_t*)message.data(), message.size());
		if (message.back() != '\r' && message.back() != '\n')
			resource->write((uint8_t*)"\n", 1);

		if (time - repack_time < (int64_t)archive_repack_interval)
			return;

		auto state = os::file::get_properties(resource->virtual_name());
		size_t current_size = state ? state->size : 0;
		repack_time = time;
		if (current_size <= archive_size)
			return;

		string path = string(resource->virtual_name());
		resource = os::file::open_archive(path, archive_size).or_else(nullptr);
	}

	protocol::protocol(const inline_args& environment) : database(this)
	{
		if (!environment.params.empty())
			path = environment.params.back();

		auto library = os::directory::get_module();
		if (!path.empty())
			path = os::path::resolve(path, *library, true).or_else(string(path));

		error_handling::set_flag(log_option::pretty, true);
		error_handling::set_flag(log_option::dated, true);
		error_handling::set_flag(log_option::active, true);
		console::get()->attach();

		uptr<schema> config;
		if (!path.empty())
		{
			auto content = os::file::read_as_string(path);
			if (content)
			{
				auto data = schema::from_json(*content);
				if (data)
					config = *data;
				else
					VI_ERR("config %s is not JSON compliant: %s", path.c_str(), data.what().c_str());
			}
			else
				VI_ERR("config %s is not readable", path.c_str());
		}

		if (!environment.args.empty())
		{
			if (!config)
				config = var::set::object();
			for (auto& [key, value] : environment.args)
			{
				auto parent = *config;
				for (auto& name : stringify::split(key, '.'))
				{
					auto child = parent->get(name);
					parent = (child ? child : parent->set(name, var::set::object()));
				}
				parent->value = var::any(value);
			}
		}

		if (config)
			load_config(*config);
		else
			path.clear();

		if (user.storage.path.empty())
		{
#ifdef VI_MICROSOFT
			user.storage.path = "./";
#else
			user.storage.path = "/var/lib/custody/";
#endif
		}

		open_logs();
	}
	protocol::~protocol()
	{
		database.checkpoint();
		database.reset();
		error_handling::set_callback(nullptr);
	}
	void protocol::load_config(schema* config)
	{
		auto* value = config->get("network");
		if (value != nullptr && value->value.is(var_type::string))
		{
			auto type = value->value.get_blob();
			if (type == "mainnet")
				user.network = network_type::mainnet;
			else if (type == "testnet")
				user.network = network_type::testnet;
			else if (type == "regtest")
				user.network = network_type::regtest;
		}

		value = config->fetch("monitor.polling_interval");
		if (value != nullptr && value->value.is(var_type::integer))
			user.monitor.polling_interval = value->value.get_integer();

		value = config->fetch("monitor.max_backoff");
		if (value != nullptr && value->value.is(var_type::integer))
			user.monitor.max_backoff = value->value.get_integer();

		value = config->fetch("monitor.max_consecutive_errors");
		if (value != nullptr && value->value.is(var_type::integer))
			user.monitor.max_consecutive_errors = value->value.get_integer();

		value = config->fetch("monitor.required_confirmations");
		if (value != nullptr && value->value.is(var_type::integer))
			user.monitor.required_confirmations = value->value.get_integer();

		value = config->fetch("monitor.history_size");
		if (value != nullptr && value->value.is(var_type::integer))
			user.monitor.history_size = value->value.get_integer();

		value = config->fetch("monitor.logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.monitor.logging = value->value.get_boolean();

		value = config->fetch("relay.timeout");
		if (value != nullptr && value->value.is(var_type::integer))
			user.relay.timeout = value->value.get_integer();

		value = config->fetch("relay.retry_timeout");
		if (value != nullptr && value->value.is(var_type::integer))
			user.relay.retry_timeout = value->value.get_integer();

		value = config->fetch("relay.max_retries");
		if (value != nullptr && value->value.is(var_type::integer))
			user.relay.max_retries = value->value.get_integer();

		value = config->fetch("relay.max_response_size");
		if (value != nullptr && value->value.is(var_type::integer))
			user.relay.max_response_size = value->value.get_integer();

		value = config->fetch("relay.logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.relay.logging = value->value.get_boolean();

		value = config->fetch("explorer.cache_expiration");
		if (value != nullptr && value->value.is(var_type::integer))
			user.explorer.cache_expiration = value->value.get_integer();

		value = config->fetch("explorer.logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.explorer.logging = value->value.get_boolean();

		value = config->fetch("settlement.logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.settlement.logging = value->value.get_boolean();

		value = config->fetch("tcp.tls_trusted_peers");
		if (value != nullptr && value->value.is(var_type::integer))
			user.tcp.tls_trusted_peers = value->value.get_integer();

		value = config->fetch("storage.path");
		if (value != nullptr && value->value.is(var_type::string))
			user.storage.path = value->value.get_blob();

		value = config->fetch("storage.optimization");
		if (value != nullptr && value->value.is(var_type::string))
		{
			auto type = value->value.get_blob();
			if (type == "speed")
				user.storage.optimization = storage_optimization::speed;
			else if (type == "safety")
				user.storage.optimization = storage_optimization::safety;
		}

		value = config->fetch("storage.index_page_size");
		if (value != nullptr && value->value.is(var_type::integer))
			user.storage.index_page_size = value->value.get_integer();

		value = config->fetch("storage.index_cache_size");
		if (value != nullptr && value->value.is(var_type::integer))
			user.storage.index_cache_size = value->value.get_integer();

		value = config->fetch("storage.logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.storage.logging = value->value.get_boolean();

		value = config->fetch("logs.info");
		if (value != nullptr && value->value.is(var_type::string))
			user.logs.info_path = value->value.get_blob();

		value = config->fetch("logs.error");
		if (value != nullptr && value->value.is(var_type::string))
			user.logs.error_path = value->value.get_blob();

		value = config->fetch("logs.query");
		if (value != nullptr && value->value.is(var_type::string))
			user.logs.query_path = value->value.get_blob();

		value = config->fetch("logs.archive_size");
		if (value != nullptr && value->value.is(var_type::integer))
			user.logs.archive_size = value->value.get_integer();

		value = config->fetch("logs.archive_repack_interval");
		if (value != nullptr && value->value.is(var_type::integer))
			user.logs.archive_repack_interval = value->value.get_integer();

		value = config->fetch("logs.control_logging");
		if (value != nullptr && value->value.is(var_type::boolean))
			user.logs.control_logging = value->value.get_boolean();

		auto* chains = config->get("chains");
		if (chains != nullptr && chains->value.get_type() == var_type::object)
		{
			for (auto* item : chains->get_childs())
			{
				auto& target = chain(item->key);
				value = item->get("network");
				if (value != nullptr && value->value.is(var_type::string))
					target.network = value->value.get_blob();

				value = item->get("explorer_api_key");
				if (value != nullptr && value->value.is(var_type::string))
					target.explorer_api_key = value->value.get_blob();

				value = item->get("confirmations");
				if (value != nullptr && value->value.is(var_type::integer))
					target.confirmations = value->value.get_integer();

				value = item->get("rps");
				if (value != nullptr && (value->value.is(var_type::number) || value->value.is(var_type::integer)))
					target.rps = value->value.get_number();

				value = item->get("rescan_on_watch");
				if (value != nullptr && value->value.is(var_type::boolean))
					target.rescan_on_watch = value->value.get_boolean();

				value = item->fetch("node.host");
				if (value != nullptr && value->value.is(var_type::string))
					target.node.host = value->value.get_blob();

				value = item->fetch("node.port");
				if (value != nullptr && value->value.is(var_type::integer))
					target.node.port = (uint16_t)value->value.get_integer();

				value = item->fetch("node.username");
				if (value != nullptr && value->value.is(var_type::string))
					target.node.username = value->value.get_blob();

				value = item->fetch("node.password");
				if (value != nullptr && value->value.is(var_type::string))
					target.node.password = value->value.get_blob();

				value = item->fetch("node.wallet");
				if (value != nullptr && value->value.is(var_type::string))
					target.node.wallet = value->value.get_blob();
			}
		}

		auto* tokens = config->get("tokens");
		if (tokens != nullptr && tokens->value.get_type() == var_type::object)
		{
			for (auto* chain_tokens : tokens->get_childs())
			{
				auto& targets = user.tokens[upper_of(chain_tokens->key)];
				for (auto* item : chain_tokens->get_childs())
				{
					auto& target = targets[upper_of(item->key)];
					value = item->get("decimals");
					if (value != nullptr && value->value.is(var_type::integer))
						target.decimals = (uint8_t)value->value.get_integer();

					value = item->get("precision");
					if (value != nullptr && value->value.is(var_type::integer))
						target.precision = (int16_t)value->value.get_integer();

					auto percentage = config_decimal(item->fetch("fee.percentage"));
					if (percentage)
						target.fee_percentage = std::move(*percentage);

					auto minimum = config_decimal(item->fetch("fee.min"));
					if (minimum)
						target.fee_minimum = std::move(*minimum);
				}
			}
		}
	}
	void protocol::open_logs()
	{
		auto library = os::directory::get_module();
		auto database_path = database.resolve(user.network, user.storage.path);
		auto open = [&](logger& target, const string& relative_path)
		{
			if (relative_path.empty())
				return;

			auto log_base = database_path + relative_path;
			auto log_path = os::path::resolve(os::path::resolve(log_base, *library, true).or_else(relative_path)).or_else(relative_path);
			os::directory::patch(os::path::get_directory(log_path));
			target.archive_size = user.logs.archive_size;
			target.archive_repack_interval = user.logs.archive_repack_interval;
			if (!log_path.empty())
				target.resource = os::file::open_archive(log_path, user.logs.archive_size).or_else(nullptr);
		};
		open(logs.info, user.logs.info_path);
		open(logs.error, user.logs.error_path);
		open(logs.query, user.logs.query_path);
		if (logs.query.resource)
			sqlite::driver::get()->set_query_log([this](const std::string_view& data) { logs.query.output(data); });

		if (logs.info.resource || logs.error.resource)
		{
			error_handling::set_callback([this](error_handling::details& data)
			{
				if (data.type.level == log_level::error || data.type.level == log_level::warning || data.type.fatal)
				{
					if (logs.error.resource)
						logs.error.output(error_handling::get_message_text(data));
				}
				else if (logs.info.resource)
					logs.info.output(error_handling::get_message_text(data));
			});
		}
	}
	protocol::chain_config& protocol::chain(const std::string_view& id)
	{
		return user.chains[upper_of(id)];
	}
	const protocol::chain_config* protocol::find_chain(const std::string_view& id) const
	{
		auto it = user.chains.find(upper_of(id));
		return it != user.chains.end() ? &it->second : nullptr;
	}
	const protocol::token_config* protocol::find_token(const std::string_view& chain_id, const std::string_view& currency) const
	{
		auto chain_it = user.tokens.find(upper_of(chain_id));
		if (chain_it == user.tokens.end())
			return nullptr;

		auto it = chain_it->second.find(upper_of(currency));
		return it != chain_it->second.end() ? &it->second : nullptr;
	}
	void protocol::apply_environment(const std::string_view& id)
	{
		auto& target = chain(id);
		if (auto* value = environment_of(id, "NETWORK"))
			target.network = value;
		if (auto* value = environment_of(id, "EXPLORER_API_KEY"))
			target.explorer_api_key = value;
		if (auto* value = environment_of(id, "NODE_HOST"))
			target.node.host = value;
		if (auto* value = environment_of(id, "NODE_PORT"))
			target.node.port = (uint16_t)from_string<uint32_t>(value).or_else(target.node.port);
		if (auto* value = environment_of(id, "NODE_USER"))
			target.node.username = value;
		if (auto* value = environment_of(id, "NODE_PASSWORD"))
			target.node.password = value;
		if (auto* value = environment_of(id, "CONFIRMATIONS"))
			target.confirmations = from_string<uint64_t>(value).or_else(target.confirmations);
	}
	bool protocol::is(network_type type) const
	{
		return user.network == type;
	}
	bool protocol::custom() const
	{
		return !path.empty();
	}
}
