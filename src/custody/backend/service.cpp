#include "service.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			tron_fetcher::tron_fetcher(server_relay& new_relay, const chain_descriptor& new_chain) noexcept : relay(new_relay), chain(new_chain)
			{
			}
			expects_promise_rt<vector<observed_transaction>> tron_fetcher::fetch(const std::string_view& address, fetch_policy policy)
			{
				string target = string(address);
				auto host = get_host(chain);
				if (!host)
					coreturn expects_rt<vector<observed_transaction>>(remote_exception(std::move(host.error().message())));

				server_relay::error_reporter reporter;
				reporter.type = "trongrid";
				reporter.method = "transactions";

				string url = stringify::text("https://%s/v1/accounts/%s/transactions?only_to=true&only_confirmed=true&limit=50&order_by=block_timestamp,asc", host->c_str(), target.c_str());
				auto response = coawait(relay.execute_http(reporter, "GET", url, std::string_view(), std::string_view()));
				if (!response)
					coreturn expects_rt<vector<observed_transaction>>(std::move(response.error()));

				uptr<schema> data = *response;
				coreturn parse_transactions(target, *data);
			}
			expects_promise_rt<transaction_detail> tron_fetcher::get_detail(const observed_transaction& item)
			{
				return expects_promise_rt<transaction_detail>(expects_rt<transaction_detail>(transaction_detail::from_observation(item)));
			}
			const chain_descriptor& tron_fetcher::get_chain() const
			{
				return chain;
			}
			expects_rt<vector<observed_transaction>> tron_fetcher::parse_transactions(const std::string_view& address, schema* data) const
			{
				if (!data || !data->value.is(var_type::object))
					return remote_exception("invalid trongrid response: not an object");
				else if (data->has("success") && !data->get_var("success").get_boolean())
					return remote_exception("trongrid error: " + (data->has("error") ? data->get_var("error").get_blob() : string("request failed")));

				auto* list = data->get("data");
				if (!list || !list->value.is(var_type::array))
					return remote_exception("invalid trongrid response: expected {data: array}");

				vector<observed_transaction> transactions;
				for (auto& raw : list->get_childs())
				{
					auto* contract = raw->fetch("raw_data.contract.0");
					if (!contract || contract->get_var("type").get_blob() != "TransferContract")
						continue;

					auto* result = raw->fetch("ret.0");
					if (result != nullptr && result->has("contractRet") && result->get_var("contractRet").get_blob() != "SUCCESS")
						continue;

					auto* value = contract->fetch("parameter.value");
					if (!value || !value->has("amount"))
						return remote_exception("invalid trongrid response: transfer without amount");

					observed_transaction item;
					item.hash = raw->get_var("txID").get_blob();
					item.chain = chain.id;
					item.address = string(address);
					item.from = value->get_var("owner_address").get_blob();
					item.to = string(address);
					item.raw_value = value->get_var("amount").get_blob();
					item.value = chain.to_standard(decimal(std::string_view(item.raw_value)));
					item.confirmations = chain.required_confirmations;
					item.direction = transfer_direction::incoming;
					item.block_time = raw->get_var("block_timestamp").get_integer() / 1000;
					if (!item.hash.empty())
						transactions.emplace_back(std::move(item));
				}
				return transactions;
			}
			expects_lr<string> tron_fetcher::get_host(const chain_descriptor& chain)
			{
				auto& transport = chain.transport;
				auto it = transport.networks.find(transport.network);
				if (it == transport.networks.end() || it->second.explorer.empty())
					return layer_exception(stringify::text("unsupported or misconfigured network: %s for chain: %s", transport.network.c_str(), chain.id.c_str()));

				return it->second.explorer;
			}

			tron_estimator::tron_estimator(server_relay& new_relay, const chain_descriptor& new_chain) noexcept : relay(new_relay), chain(new_chain)
			{
			}
			expects_promise_rt<decimal> tron_estimator::estimate_network_fee(const std::string_view& to_address)
			{
				auto host = tron_fetcher::get_host(chain);
				if (!host)
					coreturn expects_rt<decimal>(remote_exception(std::move(host.error().message())));

				server_relay::error_reporter reporter;
				reporter.type = "trongrid";
				reporter.method = "getchainparameters";

				auto response = coawait(relay.execute_http(reporter, "POST", stringify::text("https://%s/wallet/getchainparameters", host->c_str()), std::string_view(), std::string_view()));
				if (!response)
					coreturn expects_rt<decimal>(std::move(response.error()));

				uptr<schema> data = *response;
				auto* parameters = data->get("chainParameter");
				if (!parameters)
					coreturn expects_rt<decimal>(remote_exception("invalid trongrid response: expected {chainParameter: array}"));

				for (auto& parameter : parameters->get_childs())
				{
					if (parameter->get_var("key").get_blob() != "getTransactionFee")
						continue;

					decimal fee = decimal(parameter->get_var("value").get_integer()) * decimal(typical_bandwidth);
					coreturn expects_rt<decimal>(chain.to_standard(fee));
				}

				coreturn expects_rt<decimal>(remote_exception("trongrid chain parameters do not contain getTransactionFee"));
			}
			expects_promise_rt<bool> tron_estimator::is_activated(const std::string_view& address)
			{
				string target = string(address);
				auto host = tron_fetcher::get_host(chain);
				if (!host)
					coreturn expects_rt<bool>(remote_exception(std::move(host.error().message())));

				server_relay::error_reporter reporter;
				reporter.type = "trongrid";
				reporter.method = "accounts";

				auto response = coawait(relay.execute_http(reporter, "GET", stringify::text("https://%s/v1/accounts/%s", host->c_str(), target.c_str()), std::string_view(), std::string_view()));
				if (!response)
					coreturn expects_rt<bool>(std::move(response.error()));

				uptr<schema> data = *response;
				auto* accounts = data->get("data");
				if (!accounts || !accounts->value.is(var_type::array))
					coreturn expects_rt<bool>(remote_exception("invalid trongrid response: expected {data: array}"));

				coreturn expects_rt<bool>(accounts->size() > 0);
			}

			monero_estimator::monero_estimator(server_relay& new_relay, const chain_descriptor& new_chain) noexcept : relay(new_relay), chain(new_chain)
			{
			}
			expects_promise_rt<decimal> monero_estimator::estimate_network_fee(const std::string_view& to_address)
			{
				server_relay::error_reporter reporter;
				reporter.type = "jrpc";
				reporter.method = "get_fee_estimate";

				auto response = coawait(relay.execute_rpc(reporter, "get_fee_estimate", { }, "/json_rpc"));
				if (!response)
					coreturn expects_rt<decimal>(std::move(response.error()));

				uptr<schema> data = *response;
				if (!data->has("fee"))
					coreturn expects_rt<decimal>(remote_exception("invalid wallet response: fee estimate is missing"));

				decimal fee = decimal(data->get_var("fee").get_integer()) * decimal(typical_transaction_weight);
				coreturn expects_rt<decimal>(chain.to_standard(fee));
			}
			expects_promise_rt<bool> monero_estimator::is_activated(const std::string_view& address)
			{
				return expects_promise_rt<bool>(expects_rt<bool>(true));
			}
		}
	}
}
