#include "warden.h"

namespace custody
{
	namespace warden
	{
		static string lower_of(const std::string_view& value)
		{
			string result = string(value);
			stringify::to_lower(result);
			return result;
		}

		value_transfer::value_transfer() : value(decimal::zero())
		{
		}
		value_transfer::value_transfer(const std::string_view& new_address, const decimal& new_value) : address(new_address), value(new_value)
		{
		}
		uptr<schema> value_transfer::as_schema() const
		{
			schema* data = var::set::object();
			data->set("address", var::string(address));
			data->set("value", var::string(value.to_string()));
			return data;
		}

		uptr<schema> observed_transaction::as_schema() const
		{
			schema* data = var::set::object();
			data->set("hash", var::string(hash));
			data->set("chain", var::string(chain));
			data->set("address", var::string(address));
			data->set("from", var::string(from));
			data->set("to", var::string(to));
			data->set("raw_value", var::string(raw_value));
			data->set("value", var::string(value.to_string()));
			data->set("confirmations", var::integer(confirmations));
			data->set("direction", var::string(direction == transfer_direction::incoming ? "incoming" : (direction == transfer_direction::outgoing ? "outgoing" : "internal")));
			data->set("block_time", var::integer(block_time));
			return data;
		}

		transaction_detail::transaction_detail() : fee(decimal::zero())
		{
		}
		decimal transaction_detail::paid_to(const std::string_view& address) const
		{
			decimal total = decimal::zero();
			for (auto& output : outputs)
			{
				if (output.address == address)
					total = total + output.value;
			}
			return total;
		}
		vector<string> transaction_detail::senders() const
		{
			vector<string> result;
			for (auto& input : inputs)
			{
				if (!input.address.empty() && std::find(result.begin(), result.end(), input.address) == result.end())
					result.push_back(input.address);
			}
			return result;
		}
		vector<string> transaction_detail::receivers() const
		{
			vector<string> result;
			for (auto& output : outputs)
			{
				if (!output.address.empty() && std::find(result.begin(), result.end(), output.address) == result.end())
					result.push_back(output.address);
			}
			return result;
		}
		uptr<schema> transaction_detail::as_schema() const
		{
			schema* data = var::set::object();
			data->set("hash", var::string(hash));
			data->set("block_hash", var::string(block_hash));
			data->set("fee", var::string(fee.to_string()));
			data->set("confirmations", var::integer(confirmations));
			data->set("block_time", var::integer(block_time));
			auto* inputs_data = data->set("inputs", var::set::array());
			for (auto& input : inputs)
				inputs_data->push(input.as_schema().reset());
			auto* outputs_data = data->set("outputs", var::set::array());
			for (auto& output : outputs)
				outputs_data->push(output.as_schema().reset());
			return data;
		}
		transaction_detail transaction_detail::from_observation(const observed_transaction& item)
		{
			transaction_detail result;
			result.hash = item.hash;
			result.confirmations = item.confirmations;
			result.block_time = item.block_time;
			if (!item.from.empty())
				result.inputs.push_back(value_transfer(item.from, item.value));
			result.outputs.push_back(value_transfer(item.to.empty() ? item.address : item.to, item.value));
			return result;
		}

		server_channel::server_channel() noexcept : allowed(true)
		{
		}
		server_channel::~server_channel()
		{
			cancel_activities();
		}
		expects_promise_system<http_reply> server_channel::fetch(http_request&& request)
		{
			if (!allowed)
				return expects_promise_system<http_reply>(system_exception("http fetch: shutdown", std::make_error_condition(std::errc::network_down)));

			location origin(request.url);
			if (origin.protocol != "http" && origin.protocol != "https")
				return expects_promise_system<http_reply>(system_exception("http fetch: invalid protocol", std::make_error_condition(std::errc::address_family_not_supported)));

			http::request_frame frame;
			frame.location.assign(origin.path);
			frame.set_method(request.method);
			if (!request.username.empty() || !request.password.empty())
				frame.set_header("Authorization", http::permissions::authorize(request.username, request.password));
			else if (!origin.username.empty() || !origin.password.empty())
				frame.set_header("Authorization", http::permissions::authorize(origin.username, origin.password));

			if (!request.body.empty())
			{
				frame.set_header("Content-Type", request.content_type);
				frame.content.assign(request.body);
			}

			for (auto& item : origin.query)
				frame.query += item.first + "=" + item.second + "&";
			if (!frame.query.empty())
				frame.query.pop_back();

			size_t max_size = request.max_size;
			bool secure = origin.protocol == "https";
			string hostname = origin.hostname;
			string port = origin.port > 0 ? to_string(origin.port) : string(secure ? "443" : "80");
			int32_t verify_peers = (secure ? (request.verify_peers >= 0 ? request.verify_peers : PEER_NOT_VERIFIED) : PEER_NOT_SECURE);
			http::client* client = new http::client(request.timeout);
			add_activity(client);
			return dns::get()->lookup_deferred(hostname, port, dns_type::connect, socket_protocol::TCP, socket_type::stream).then<expects_promise_system<http_reply>>([this, client, max_size, verify_peers, frame = std::move(frame)](expects_system<socket_address>&& address) mutable -> expects_promise_system<http_reply>
			{
				if (!address)
				{
					remove_activity(client);
					return expects_promise_system<http_reply>(address.error());
				}

				return client->connect_async(*address, verify_peers).then<expects_promise_system<void>>([client, max_size, frame = std::move(frame)](expects_system<void>&& status) mutable -> expects_promise_system<void>
				{
					if (!status)
						return expects_promise_system<void>(status);

					return client->send_fetch(std::move(frame), max_size);
				}).then<expects_promise_system<http_reply>>([this, client](expects_system<void>&& status) -> expects_promise_system<http_reply>
				{
					if (!status)
					{
						remove_activity(client);
						return expects_promise_system<http_reply>(status.error());
					}

					auto* response = client->get_response();
					http_reply reply;
					reply.status_code = response->status_code;
					reply.content_type = string(response->get_header("Content-Type"));
					reply.content = string(response->content.get_text());
					return client->disconnect().then<expects_system<http_reply>>([this, client, reply = std::move(reply)](expects_system<void>&&) mutable -> expects_system<http_reply>
					{
						remove_activity(client);
						return std::move(reply);
					});
				});
			});
		}
		void server_channel::allow_activities()
		{
			allowed = true;
		}
		void server_channel::cancel_activities()
		{
			umutex<std::recursive_mutex> unique(mutex);
			allowed = false;
			for (auto& client : activities)
			{
				auto* stream = client->get_stream();
				if (stream != nullptr)
					stream->shutdown(true);
			}
		}
		bool server_channel::is_activity_allowed() const
		{
			return allowed;
		}
		void server_channel::add_activity(http::client* client)
		{
			umutex<std::recursive_mutex> unique(mutex);
			activities.insert(client);
		}
		void server_channel::remove_activity(http::client* client)
		{
			umutex<std::recursive_mutex> unique(mutex);
			activities.erase(client);
			client->release();
		}

		server_relay::server_relay(const protocol& new_params, http_channel* new_channel, scheduler* new_timers, const std::string_view& new_url, const std::string_view& new_username, const std::string_view& new_password, double new_rps) noexcept : params(new_params), channel(new_channel), timers(new_timers), url(new_url), username(new_username), password(new_password), latest(0), rps(new_rps), allowed(true)
		{
			VI_ASSERT(channel != nullptr, "channel should be set");
			VI_ASSERT(timers != nullptr, "scheduler should be set");
			stringify::trim(url);
		}
		server_relay::~server_relay() noexcept
		{
			cancel_activities();
		}
		expects_promise_rt<schema*> server_relay::execute_rpc(error_reporter& reporter, const std::string_view& method, const schema_list& args, const std::string_view& path)
		{
			if (reporter.type.empty())
				reporter.type = "jrpc";
			if (reporter.method.empty())
				reporter.method = method;

			schema* params_data = var::set::array();
			params_data->reserve(args.size());
			for (auto& item : args)
				params_data->push(item->copy());

			uptr<schema> setup = var::set::object();
			setup->set("jsonrpc", var::string("1.0"));
			setup->set("id", var::string("custody"));
			setup->set("method", var::string(method));
			setup->set("params", params_data);

			auto response_status = coawait(execute_rest(reporter, "POST", path, *setup));
			if (!response_status)
				coreturn expects_rt<schema*>(std::move(response_status.error()));

			uptr<schema> response = *response_status;
			if (response->has("error.code"))
			{
				string code = response->fetch_var("error.code").get_blob();
				string description = response->has("error.message") ? response->fetch_var("error.message").get_blob() : "no error description";
				coreturn expects_rt<schema*>(remote_exception(generate_error_message(nullptr, reporter, code, description)));
			}
			else if (response->has("error.message"))
			{
				string description = response->fetch_var("error.message").get_blob();
				coreturn expects_rt<schema*>(remote_exception(generate_error_message(nullptr, reporter, "null", description)));
			}

			schema* result = response->get("result");
			if (!result)
			{
				string description = response->value.get_type() == var_type::string ? response->value.get_blob() : "no error description";
				coreturn expects_rt<schema*>(remote_exception(generate_error_message(nullptr, reporter, "null", description)));
			}

			result->unlink();
			coreturn expects_rt<schema*>(result);
		}
		expects_promise_rt<schema*> server_relay::execute_rest(error_reporter& reporter, const std::string_view& method, const std::string_view& path, schema* args)
		{
			if (reporter.type.empty())
				reporter.type = "rest";

			string body = (args ? schema::to_json(args) : string());
			coreturn coawait(execute_http(reporter, method, path, "application/json", body));
		}
		expects_promise_rt<schema*> server_relay::execute_http(error_reporter& reporter, const std::string_view& method, const std::string_view& path, const std::string_view& type, const std::string_view& body)
		{
			if (reporter.type.empty())
				reporter.type = "http";

			string target_url = get_node_url(path);
			if (reporter.method.empty())
			{
				string target_path = location(target_url).path;
				reporter.method = target_path.size() > 1 ? target_path.substr(1) : string(method);
			}

			if (!allowed)
				coreturn expects_rt<schema*>(remote_exception::shutdown());

			auto& options = params.user.relay;
			if (rps > 0.0)
			{
				const uint64_t time = timers->now();
				const double timeout = (double)(time - latest);
				const double limit = 1000.0 / rps;
				uint64_t retry_timeout = (uint64_t)(limit - timeout);
				if (latest > 0 && timeout < limit && !coawait(yield_for_cooldown(retry_timeout, options.timeout)))
					coreturn expects_rt<schema*>(remote_exception::retry());
				else if (!allowed)
					coreturn expects_rt<schema*>(remote_exception::shutdown());
				latest = timers->now();
			}

			http_request setup;
			setup.method = method;
			setup.url = target_url;
			setup.username = username;
			setup.password = password;
			setup.max_size = (size_t)options.max_response_size;
			setup.verify_peers = (int32_t)params.user.tcp.tls_trusted_peers;
			setup.timeout = options.timeout;
			if (!body.empty())
			{
				setup.content_type = type;
				setup.body = body;
			}

			uint64_t retry_responses = 0;
			uint64_t retry_timeout = options.retry_timeout;
		retry:
			auto response = coawait(channel->fetch(http_request(setup)));
			if (!response || is_retryable(*response))
			{
				const http_reply* reply = response ? &*response : nullptr;
				if (options.logging)
					VI_WARN("[relay] %s %s failed: %s (retry: %" PRIu64 ")", setup.method.c_str(), reporter.method.c_str(), response ? stringify::text("status %i", reply->status_code).c_str() : response.error().message().c_str(), retry_responses + 1);

				++retry_responses;
				if (retry_responses > options.max_retries)
					coreturn expects_rt<schema*>(remote_exception::transient(generate_error_message(reply, reporter, "null", "node has rejected the request too many times")));
				else if (!coawait(yield_for_cooldown(retry_timeout, setup.timeout)))
					coreturn expects_rt<schema*>(allowed ? remote_exception::transient(generate_error_message(reply, reporter, "null", "node has rejected the request after cooldown")) : remote_exception::shutdown());
				else if (!allowed)
					coreturn expects_rt<schema*>(remote_exception::shutdown());
				goto retry;
			}

			uptr<schema> result;
			if (stringify::starts_with(response->content_type, "application/json"))
			{
				auto data = schema::from_json(response->content);
				if (!data)
					coreturn expects_rt<schema*>(remote_exception(generate_error_message(&*response, reporter, "null", "node's response is not JSON compliant")));

				result = *data;
			}
			else if (response->status_code >= 400)
				coreturn expects_rt<schema*>(remote_exception(generate_error_message(&*response, reporter, "null", response->content)));
			else if (response->content_type == "application/octet-stream")
				result = var::set::binary(response->content);
			else
				result = var::set::string(response->content);

			coreturn expects_rt<schema*>(result.reset());
		}
		promise<bool> server_relay::yield_for_cooldown(uint64_t& retry_timeout, uint64_t total_timeout_ms)
		{
			if (total_timeout_ms > 0 && retry_timeout >= total_timeout_ms)
				coreturn false;

			promise<bool> future;
			task_id timer_id = enqueue_activity(future, timers->schedule(retry_timeout, [future]() mutable
			{
				if (future.is_pending())
					future.set(true);
			}, token));
			if (!coawait(std::move(future)))
				coreturn false;

			dequeue_activity(timer_id);
			retry_timeout *= 2;
			coreturn true;
		}
		void server_relay::allow_activities()
		{
			allowed = true;
		}
		void server_relay::cancel_activities()
		{
			umutex<std::recursive_mutex> unique(mutex);
			allowed = false;
			for (auto& task : tasks)
			{
				timers->cancel(task.second);
				if (task.first.is_pending())
					task.first.set(false);
			}
			tasks.clear();
		}
		bool server_relay::is_activity_allowed() const
		{
			return allowed;
		}
		const string& server_relay::get_node_url() const
		{
			return url;
		}
		string server_relay::get_node_url(const std::string_view& path) const
		{
			if (stringify::starts_with(path, "http"))
				return string(path);

			string target = url;
			if (target.empty() || path.empty())
				return target;

			if (target.back() == '/' && path.front() == '/')
				target.erase(target.end() - 1);
			else if (target.back() != '/' && path.front() != '/')
				target += '/';
			target += path;
			return target;
		}
		string server_relay::generate_error_message(const http_reply* response, const error_reporter& reporter, const std::string_view& error_code, const std::string_view& error_message)
		{
			string_stream message;
			message << "warden::" << reporter.type << "::" << lower_of(reporter.method) << " error: ";
			if (error_message.empty())
				message << "no response";
			else
				message << error_message;
			message << " (netc: " << (response ? response->status_code : 500) << ", " << reporter.type << "c: " << error_code << ")";
			return message.str();
		}
		bool server_relay::is_retryable(const http_reply& response)
		{
			return response.status_code == 408 || response.status_code == 429 || response.status_code == 502 || response.status_code == 503 || response.status_code == 504;
		}
		task_id server_relay::enqueue_activity(const promise<bool>& future, task_id timer_id)
		{
			if (future.is_pending())
			{
				umutex<std::recursive_mutex> unique(mutex);
				tasks.push_back(std::make_pair(future, timer_id));
			}
			if (!allowed)
				cancel_activities();
			return timer_id;
		}
		void server_relay::dequeue_activity(task_id timer_id)
		{
			umutex<std::recursive_mutex> unique(mutex);
			for (auto it = tasks.begin(); it != tasks.end(); it++)
			{
				if (it->second == timer_id)
				{
					tasks.erase(it);
					break;
				}
			}
		}

		const char* node_client::nd_call::get_blockchain_info()
		{
			return "getblockchaininfo";
		}
		const char* node_client::nd_call::load_wallet()
		{
			return "loadwallet";
		}
		const char* node_client::nd_call::create_wallet()
		{
			return "createwallet";
		}
		const char* node_client::nd_call::import_address()
		{
			return "importaddress";
		}
		const char* node_client::nd_call::list_transactions()
		{
			return "listtransactions";
		}
		const char* node_client::nd_call::list_unspent()
		{
			return "listunspent";
		}
		const char* node_client::nd_call::get_transaction()
		{
			return "gettransaction";
		}
		const char* node_client::nd_call::get_raw_transaction()
		{
			return "getrawtransaction";
		}
		const char* node_client::nd_call::decode_raw_transaction()
		{
			return "decoderawtransaction";
		}
		const char* node_client::nd_call::send_raw_transaction()
		{
			return "sendrawtransaction";
		}
		const char* node_client::nd_call::estimate_smart_fee()
		{
			return "estimatesmartfee";
		}
		const char* node_client::nd_call::rescan_blockchain()
		{
			return "rescanblockchain";
		}

		node_client::node_client(server_relay& new_relay, const chain_descriptor& new_chain) noexcept : relay(new_relay), chain(new_chain), wallet_ready(false)
		{
		}
		expects_promise_rt<schema*> node_client::call(const std::string_view& method, schema_list&& args)
		{
			server_relay::error_reporter reporter;
			reporter.type = "jrpc";
			reporter.method = method;
			coreturn coawait(relay.execute_rpc(reporter, method, args));
		}
		expects_promise_rt<schema*> node_client::call_wallet(const std::string_view& method, schema_list&& args)
		{
			auto status = coawait(ensure_wallet());
			if (!status)
				coreturn expects_rt<schema*>(std::move(status.error()));

			server_relay::error_reporter reporter;
			reporter.type = "jrpc";
			reporter.method = method;

			string path = "/wallet/" + get_wallet_name();
			auto result = coawait(relay.execute_rpc(reporter, method, args, path));
			if (!result && has_error(result.error(), "not loaded"))
			{
				wallet_ready = false;
				status = coawait(ensure_wallet());
				if (!status)
					coreturn expects_rt<schema*>(std::move(status.error()));

				result = coawait(relay.execute_rpc(reporter, method, args, path));
			}

			coreturn std::move(result);
		}
		expects_promise_rt<void> node_client::ensure_wallet()
		{
			if (wallet_ready)
				coreturn expects_rt<void>(expectation::met);

			string name = get_wallet_name();
			schema_list load_map;
			load_map.push_back(var::set::string(name));

			auto status = coawait(call(nd_call::load_wallet(), std::move(load_map)));
			if (status)
			{
				memory::release(*status);
				wallet_ready = true;
				coreturn expects_rt<void>(expectation::met);
			}
			else if (has_error(status.error(), "already loaded"))
			{
				wallet_ready = true;
				coreturn expects_rt<void>(expectation::met);
			}
			else if (!has_error(status.error(), "not found") && !has_error(status.error(), "does not exist"))
				coreturn expects_rt<void>(std::move(status.error()));

			schema_list create_map;
			create_map.push_back(var::set::string(name));
			create_map.push_back(var::set::boolean(true));
			create_map.push_back(var::set::boolean(false));
			create_map.push_back(var::set::string(""));
			create_map.push_back(var::set::boolean(false));
			create_map.push_back(var::set::boolean(false));
			create_map.push_back(var::set::boolean(false));

			status = coawait(call(nd_call::create_wallet(), std::move(create_map)));
			if (!status && !has_error(status.error(), "already exists"))
				coreturn expects_rt<void>(std::move(status.error()));
			else if (status)
				memory::release(*status);

			VI_INFO("[node] %s wallet %s is ready", chain.id.c_str(), name.c_str());
			wallet_ready = true;
			coreturn expects_rt<void>(expectation::met);
		}
		expects_promise_rt<blockchain_info> node_client::get_blockchain_info()
		{
			auto result = coawait(call(nd_call::get_blockchain_info(), { }));
			if (!result)
				coreturn expects_rt<blockchain_info>(std::move(result.error()));

			uptr<schema> data = *result;
			blockchain_info info;
			info.chain = data->get_var("chain").get_blob();
			info.best_block_hash = data->get_var("bestblockhash").get_blob();
			info.blocks = (uint64_t)data->get_var("blocks").get_integer();
			info.headers = (uint64_t)data->get_var("headers").get_integer();
			info.verification_progress = data->get_var("verificationprogress").get_number();
			info.initial_block_download = data->get_var("initialblockdownload").get_boolean();
			coreturn expects_rt<blockchain_info>(std::move(info));
		}
		expects_promise_rt<bool> node_client::is_synced()
		{
			auto info = coawait(get_blockchain_info());
			if (!info)
				coreturn expects_rt<bool>(std::move(info.error()));

			coreturn expects_rt<bool>(info->blocks + 1 >= info->headers);
		}
		expects_promise_rt<double> node_client::get_sync_progress()
		{
			auto info = coawait(get_blockchain_info());
			if (!info)
				coreturn expects_rt<double>(std::move(info.error()));
			else if (!info->headers)
				coreturn expects_rt<double>(0.0);

			coreturn expects_rt<double>((double)info->blocks / (double)info->headers * 100.0);
		}
		expects_promise_rt<void> node_client::import_watch_address(const std::string_view& address, const std::string_view& label, bool rescan)
		{
			schema_list map;
			map.push_back(var::set::string(address));
			map.push_back(var::set::string(label));
			map.push_back(var::set::boolean(rescan));

			auto result = coawait(call_wallet(nd_call::import_address(), std::move(map)));
			if (!result)
			{
				if (has_error(result.error(), "already have this key") || has_error(result.error(), "already imported"))
					coreturn expects_rt<void>(expectation::met);

				coreturn expects_rt<void>(std::move(result.error()));
			}

			memory::release(*result);
			coreturn expects_rt<void>(expectation::met);
		}
		expects_promise_rt<vector<wallet_entry>> node_client::list_transactions(uint64_t count, uint64_t skip)
		{
			schema_list map;
			map.push_back(var::set::string("*"));
			map.push_back(var::set::integer(count));
			map.push_back(var::set::integer(skip));
			map.push_back(var::set::boolean(true));

			auto result = coawait(call_wallet(nd_call::list_transactions(), std::move(map)));
			if (!result)
				coreturn expects_rt<vector<wallet_entry>>(std::move(result.error()));

			uptr<schema> data = *result;
			if (!data->value.is(var_type::array))
				coreturn expects_rt<vector<wallet_entry>>(remote_exception("listtransactions: result is not an array"));

			vector<wallet_entry> entries;
			entries.reserve(data->size());
			for (auto& item : data->get_childs())
			{
				wallet_entry entry;
				entry.hash = item->get_var("txid").get_blob();
				entry.address = item->get_var("address").get_blob();
				entry.category = item->get_var("category").get_blob();
				entry.value = item->get_var("amount").get_decimal().truncate(chain.decimals);
				entry.index = (uint64_t)item->get_var("vout").get_integer();
				entry.confirmations = (uint64_t)std::max<int64_t>(0, item->get_var("confirmations").get_integer());
				entry.block_time = item->has("blocktime") ? item->get_var("blocktime").get_integer() : item->get_var("time").get_integer();
				if (!entry.hash.empty())
					entries.emplace_back(std::move(entry));
			}
			coreturn expects_rt<vector<wallet_entry>>(std::move(entries));
		}
		expects_promise_rt<vector<unspent_output>> node_client::list_unspent(const std::string_view& address, uint64_t min_confirmations)
		{
			schema* addresses = var::set::array();
			addresses->push(var::string(address));

			schema_list map;
			map.push_back(var::set::integer(min_confirmations));
			map.push_back(var::set::integer(9999999));
			map.push_back(addresses);
			map.push_back(var::set::boolean(true));

			auto result = coawait(call_wallet(nd_call::list_unspent(), std::move(map)));
			if (!result)
				coreturn expects_rt<vector<unspent_output>>(std::move(result.error()));

			uptr<schema> data = *result;
			if (!data->value.is(var_type::array))
				coreturn expects_rt<vector<unspent_output>>(remote_exception("listunspent: result is not an array"));

			vector<unspent_output> outputs;
			outputs.reserve(data->size());
			for (auto& item : data->get_childs())
			{
				unspent_output output;
				output.hash = item->get_var("txid").get_blob();
				output.address = item->get_var("address").get_blob();
				output.value = item->get_var("amount").get_decimal().truncate(chain.decimals);
				output.index = (uint64_t)item->get_var("vout").get_integer();
				output.confirmations = (uint64_t)item->get_var("confirmations").get_integer();
				outputs.emplace_back(std::move(output));
			}
			coreturn expects_rt<vector<unspent_output>>(std::move(outputs));
		}
		expects_promise_rt<decimal> node_client::get_balance(const std::string_view& address)
		{
			auto outputs = coawait(list_unspent(address, 1));
			if (!outputs)
				coreturn expects_rt<decimal>(std::move(outputs.error()));

			decimal balance = decimal::zero();
			for (auto& output : *outputs)
				balance = balance + output.value;
			coreturn expects_rt<decimal>(std::move(balance));
		}
		expects_promise_rt<transaction_detail> node_client::get_transaction(const std::string_view& hash)
		{
			string transaction_id = string(hash);
			schema_list map;
			map.push_back(var::set::string(transaction_id));
			map.push_back(var::set::boolean(true));
			map.push_back(var::set::boolean(true));

			uptr<schema> data;
			auto result = coawait(call_wallet(nd_call::get_transaction(), std::move(map)));
			if (result)
				data = *result;
			else if (has_error(result.error(), "non-wallet") || has_error(result.error(), "invalid or non-wallet"))
			{
				auto raw = coawait(get_raw_transaction(transaction_id, true));
				if (!raw)
					coreturn expects_rt<transaction_detail>(std::move(raw.error()));
				data = *raw;
			}
			else
				coreturn expects_rt<transaction_detail>(std::move(result.error()));

			schema* decoded = data->has("decoded") ? data->get("decoded") : *data;
			transaction_detail detail;
			detail.hash = transaction_id;
			detail.block_hash = data->get_var("blockhash").get_blob();
			detail.confirmations = (uint64_t)std::max<int64_t>(0, data->get_var("confirmations").get_integer());
			detail.block_time = data->has("blocktime") ? data->get_var("blocktime").get_integer() : data->get_var("time").get_integer();
			if (data->has("fee"))
			{
				decimal fee = data->get_var("fee").get_decimal().truncate(chain.decimals);
				detail.fee = fee.is_negative() ? decimal::zero() - fee : fee;
			}

			auto* vout = decoded->get("vout");
			if (vout != nullptr)
			{
				for (auto& output : vout->get_childs())
				{
					decimal value = output->get_var("value").get_decimal().truncate(chain.decimals);
					auto addresses = get_output_addresses(output);
					if (addresses.empty())
						detail.outputs.push_back(value_transfer(std::string_view(), value));
					else
						detail.outputs.push_back(value_transfer(*addresses.begin(), value));
				}
			}

			auto* vin = decoded->get("vin");
			if (vin != nullptr)
			{
				for (auto& input : vin->get_childs())
				{
					if (input->has("coinbase"))
						continue;

					auto* prevout = input->get("prevout");
					if (prevout != nullptr)
					{
						auto addresses = get_output_addresses(prevout);
						detail.inputs.push_back(value_transfer(addresses.empty() ? string() : *addresses.begin(), prevout->get_var("value").get_decimal().truncate(chain.decimals)));
						continue;
					}

					/* parents outside of the wallet need -txindex, unresolved inputs stay anonymous */
					string input_hash = input->get_var("txid").get_blob();
					uint64_t input_index = (uint64_t)input->get_var("vout").get_integer();
					auto previous = coawait(get_raw_transaction(input_hash, true));
					if (!previous)
					{
						VI_DEBUG("[node] %s input %s:%i of %s is not resolvable: %s", chain.id.c_str(), input_hash.c_str(), (int)input_index, transaction_id.c_str(), previous.what().c_str());
						detail.inputs.push_back(value_transfer(std::string_view(), decimal::zero()));
						continue;
					}

					uptr<schema> previous_data = *previous;
					auto* previous_output = previous_data->fetch("vout." + to_string(input_index));
					auto addresses = previous_output ? get_output_addresses(previous_output) : unordered_set<string>();
					decimal value = previous_output ? previous_output->get_var("value").get_decimal().truncate(chain.decimals) : decimal::zero();
					detail.inputs.push_back(value_transfer(addresses.empty() ? string() : *addresses.begin(), value));
				}
			}

			coreturn expects_rt<transaction_detail>(std::move(detail));
		}
		expects_promise_rt<schema*> node_client::get_raw_transaction(const std::string_view& hash, bool verbose)
		{
			schema_list map;
			map.push_back(var::set::string(hash));
			map.push_back(var::set::boolean(verbose));
			coreturn coawait(call(nd_call::get_raw_transaction(), std::move(map)));
		}
		expects_promise_rt<string> node_client::broadcast_raw(const std::string_view& raw_transaction)
		{
			string data = string(raw_transaction);
			schema_list map;
			map.push_back(var::set::string(data));

			auto result = coawait(call(nd_call::send_raw_transaction(), std::move(map)));
			if (result)
			{
				uptr<schema> response = *result;
				coreturn expects_rt<string>(response->value.get_blob());
			}

			auto message = string(result.what());
			if (!stringify::find(message, "-27").found && !has_error(result.error(), "already in block chain") && !has_error(result.error(), "transaction already in"))
				coreturn expects_rt<string>(std::move(result.error()));

			schema_list decode_map;
			decode_map.push_back(var::set::string(data));

			auto decoded = coawait(call(nd_call::decode_raw_transaction(), std::move(decode_map)));
			if (!decoded)
				coreturn expects_rt<string>(std::move(decoded.error()));

			uptr<schema> response = *decoded;
			coreturn expects_rt<string>(response->get_var("txid").get_blob());
		}
		expects_promise_rt<decimal> node_client::estimate_fee(uint64_t confirmation_target)
		{
			schema_list map;
			map.push_back(var::set::integer(confirmation_target));

			auto result = coawait(call(nd_call::estimate_smart_fee(), std::move(map)));
			if (!result)
				coreturn expects_rt<decimal>(std::move(result.error()));

			uptr<schema> data = *result;
			if (!data->has("feerate"))
			{
				string errors;
				auto* list = data->get("errors");
				if (list != nullptr)
				{
					for (auto& item : list->get_childs())
						errors += item->value.get_blob() + "; ";
				}
				if (errors.empty())
					errors = "no fee rate available";
				else
					errors.erase(errors.size() - 2);
				coreturn expects_rt<decimal>(remote_exception("fee estimation failed: " + errors));
			}

			coreturn expects_rt<decimal>(data->get_var("feerate").get_decimal().truncate(chain.decimals));
		}
		expects_promise_rt<void> node_client::rescan(uint64_t start_height)
		{
			schema_list map;
			map.push_back(var::set::integer(start_height));

			auto result = coawait(call_wallet(nd_call::rescan_blockchain(), std::move(map)));
			if (!result)
				coreturn expects_rt<void>(std::move(result.error()));

			memory::release(*result);
			coreturn expects_rt<void>(expectation::met);
		}
		const string& node_client::get_wallet_name() const
		{
			return chain.transport.node_wallet;
		}
		const chain_descriptor& node_client::get_chain() const
		{
			return chain;
		}
		bool node_client::is_wallet_ready() const
		{
			return wallet_ready;
		}
		bool node_client::has_error(const remote_exception& error, const std::string_view& needle)
		{
			return stringify::find(lower_of(error.what()), lower_of(needle)).found;
		}
		unordered_set<string> node_client::get_output_addresses(schema* output)
		{
			unordered_set<string> addresses;
			auto* script_pub_key = output->get("scriptPubKey");
			if (script_pub_key != nullptr)
			{
				if (script_pub_key->has("address"))
				{
					string value = script_pub_key->get_var("address").get_blob();
					if (!value.empty())
						addresses.insert(value);
				}

				if (script_pub_key->has("addresses"))
				{
					for (auto& item : script_pub_key->get("addresses")->get_childs())
					{
						string value = item->value.get_blob();
						if (!value.empty())
							addresses.insert(value);
					}
				}
			}
			return addresses;
		}

		void fetcher_set::assign(const chain_descriptor& chain, uptr<transaction_fetcher>&& fetcher)
		{
			string key = chain.id;
			stringify::to_upper(key);
			fetchers[key] = std::move(fetcher);
		}
		void fetcher_set::assign(const chain_descriptor& chain, uptr<fee_estimator>&& estimator)
		{
			string key = chain.id;
			stringify::to_upper(key);
			estimators[key] = std::move(estimator);
		}
		expects_lr<transaction_fetcher*> fetcher_set::get_fetcher(const std::string_view& chain) const
		{
			string key = string(chain);
			stringify::to_upper(key);
			auto it = fetchers.find(key);
			if (it == fetchers.end() || !it->second)
				return layer_exception::unsupported_chain(chain);

			return *it->second;
		}
		fee_estimator* fetcher_set::get_estimator(const std::string_view& chain) const
		{
			string key = string(chain);
			stringify::to_upper(key);
			auto it = estimators.find(key);
			return it != estimators.end() ? *it->second : nullptr;
		}
		size_t fetcher_set::size() const
		{
			return fetchers.size();
		}
	}
}
