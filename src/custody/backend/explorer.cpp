#include "explorer.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			static string lower_of(const std::string_view& value)
			{
				string result = string(value);
				stringify::to_lower(result);
				return result;
			}
			static bool is_empty_result(schema* data)
			{
				if (data->get_var("status").get_blob() != "0")
					return false;

				string message = lower_of(data->get_var("message").get_blob());
				return message == "notok" || stringify::find(message, "no transactions found").found;
			}

			explorer_fetcher::explorer_fetcher(server_relay& new_relay, storages::cachestate* new_cache, const chain_descriptor& new_chain, uint64_t new_cache_expiration, bool new_logging) noexcept : relay(new_relay), cache(new_cache), chain(new_chain), cache_expiration(new_cache_expiration), logging(new_logging)
			{
			}
			expects_promise_rt<vector<observed_transaction>> explorer_fetcher::fetch(const std::string_view& address, fetch_policy policy)
			{
				string target = string(address);
				string key = get_cache_key(chain, target);
				if (cache != nullptr && chain.transport.cache && policy == fetch_policy::cached)
				{
					auto cached = load_cache(target, key);
					if (!cached.empty())
						coreturn expects_rt<vector<observed_transaction>>(std::move(cached));
				}

				auto url = get_url(chain, target);
				if (!url)
					coreturn expects_rt<vector<observed_transaction>>(remote_exception(std::move(url.error().message())));

				server_relay::error_reporter reporter;
				reporter.type = "explorer";
				reporter.method = "txlist";

				auto response = coawait(relay.execute_http(reporter, "GET", *url, std::string_view(), std::string_view()));
				if (!response)
					coreturn expects_rt<vector<observed_transaction>>(std::move(response.error()));

				uptr<schema> data = *response;
				auto transactions = parse_transactions(target, *data);
				if (!transactions)
				{
					if (logging)
						VI_ERR("[explorer] %s txlist for %s failed: %s", chain.id.c_str(), target.c_str(), transactions.what().c_str());
					coreturn std::move(transactions);
				}

				if (cache != nullptr && chain.transport.cache)
					store_cache(key, *transactions);

				if (logging)
					VI_DEBUG("[explorer] %s txlist for %s: %i transactions", chain.id.c_str(), target.c_str(), (int)transactions->size());
				coreturn std::move(transactions);
			}
			expects_promise_rt<transaction_detail> explorer_fetcher::get_detail(const observed_transaction& item)
			{
				return expects_promise_rt<transaction_detail>(expects_rt<transaction_detail>(transaction_detail::from_observation(item)));
			}
			const chain_descriptor& explorer_fetcher::get_chain() const
			{
				return chain;
			}
			expects_rt<vector<observed_transaction>> explorer_fetcher::parse_transactions(const std::string_view& address, schema* data) const
			{
				if (!data || !data->value.is(var_type::object))
					return remote_exception("invalid explorer response: not an object");
				else if (is_empty_result(data))
				{
					if (logging)
						VI_WARN("[explorer] %s reports %s for %.*s: %s", chain.id.c_str(), data->get_var("message").get_blob().c_str(), (int)address.size(), address.data(), data->get_var("result").get_blob().c_str());
					return vector<observed_transaction>();
				}

				auto* result = data->get("result");
				if (!result || !result->value.is(var_type::array))
					return remote_exception("invalid explorer response: expected {result: array}");

				string target = lower_of(address);
				vector<observed_transaction> transactions;
				transactions.reserve(result->size());
				for (auto& raw : result->get_childs())
				{
					if (!raw->has("hash") || !raw->has("value"))
						return remote_exception("invalid explorer response: transaction without hash or value");

					observed_transaction item;
					item.hash = raw->get_var("hash").get_blob();
					item.chain = chain.id;
					item.address = string(address);
					item.from = raw->get_var("from").get_blob();
					item.to = raw->get_var("to").get_blob();
					item.raw_value = raw->get_var("value").get_blob();
					item.value = chain.to_standard(decimal(std::string_view(item.raw_value.empty() ? string("0") : item.raw_value)));
					item.confirmations = from_string<uint64_t>(raw->get_var("confirmations").get_blob()).or_else((uint64_t)0);
					item.block_time = from_string<int64_t>(raw->get_var("timeStamp").get_blob()).or_else((int64_t)0);
					if (raw->get_var("isError").get_blob() == "1")
						continue;

					string to = lower_of(item.to), from = lower_of(item.from);
					if (to == target && from == target)
						item.direction = transfer_direction::internal;
					else if (to == target)
						item.direction = transfer_direction::incoming;
					else
						item.direction = transfer_direction::outgoing;
					transactions.emplace_back(std::move(item));
				}
				return transactions;
			}
			expects_lr<string> explorer_fetcher::get_url(const chain_descriptor& chain, const std::string_view& address)
			{
				auto& transport = chain.transport;
				if (transport.network.empty())
					return layer_exception(stringify::text("environment variable %s_NETWORK is not set", chain.id.c_str()));
				else if (transport.explorer_api && transport.api_key.empty())
					return layer_exception(stringify::text("environment variable %s_EXPLORER_API_KEY is not set", chain.id.c_str()));

				auto it = transport.networks.find(transport.network);
				if (it == transport.networks.end() || it->second.explorer.empty())
					return layer_exception(stringify::text("unsupported or misconfigured network: %s for chain: %s", transport.network.c_str(), chain.id.c_str()));

				string url = stringify::text("https://%s/v2/api?module=account&action=txlist&address=%.*s&startblock=0&endblock=99999999&sort=desc", it->second.explorer.c_str(), (int)address.size(), address.data());
				if (it->second.chain_id > 0)
					url += stringify::text("&chainid=%" PRIu64, it->second.chain_id);
				if (transport.explorer_api)
					url += "&apikey=" + transport.api_key;
				return url;
			}
			string explorer_fetcher::get_cache_key(const chain_descriptor& chain, const std::string_view& address)
			{
				return stringify::text("wallet:%.*s:transactions:%s", (int)address.size(), address.data(), lower_of(chain.id).c_str());
			}
			vector<observed_transaction> explorer_fetcher::load_cache(const std::string_view& address, const string& key)
			{
				vector<observed_transaction> transactions;
				auto data = cache->get_cache(key);
				if (!data)
					return transactions;

				uptr<schema> value = *data;
				auto* list = value->get("transactions");
				if (!list)
					return transactions;

				for (auto& raw : list->get_childs())
				{
					observed_transaction item;
					item.hash = raw->get_var("hash").get_blob();
					item.chain = chain.id;
					item.address = string(address);
					item.from = raw->get_var("from").get_blob();
					item.to = raw->get_var("to").get_blob();
					item.raw_value = raw->get_var("raw_value").get_blob();
					item.value = decimal(std::string_view(raw->get_var("value").get_blob()));
					item.confirmations = (uint64_t)raw->get_var("confirmations").get_integer();
					item.block_time = raw->get_var("block_time").get_integer();
					string direction = raw->get_var("direction").get_blob();
					item.direction = direction == "outgoing" ? transfer_direction::outgoing : (direction == "internal" ? transfer_direction::internal : transfer_direction::incoming);
					transactions.emplace_back(std::move(item));
				}

				if (logging)
					VI_DEBUG("[explorer] %s cache hit on %s", chain.id.c_str(), key.c_str());
				return transactions;
			}
			void explorer_fetcher::store_cache(const string& key, const vector<observed_transaction>& transactions)
			{
				uptr<schema> value = var::set::object();
				auto* list = value->set("transactions", var::set::array());
				for (auto& item : transactions)
					list->push(item.as_schema().reset());
				value->set("timestamp", var::integer((int64_t)(date_time().milliseconds() / 1000)));

				auto status = cache->set_cache(key, std::move(value), cache_expiration);
				if (!status && logging)
					VI_WARN("[explorer] %s cache store failed: %s", chain.id.c_str(), status.what().c_str());
			}
		}
	}
}
