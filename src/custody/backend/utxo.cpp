#include "utxo.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			utxo_fetcher::utxo_fetcher(node_client& new_node, uint64_t new_history_size) noexcept : node(new_node), history_size(new_history_size)
			{
			}
			expects_promise_rt<vector<observed_transaction>> utxo_fetcher::fetch(const std::string_view& address, fetch_policy policy)
			{
				string target = string(address);
				auto entries = coawait(node.list_transactions(history_size));
				if (!entries)
					coreturn expects_rt<vector<observed_transaction>>(std::move(entries.error()));

				auto& chain = node.get_chain();
				vector<observed_transaction> result;
				unordered_map<string, size_t> positions;
				for (auto& entry : *entries)
				{
					if (entry.address != target || entry.category != "receive")
						continue;

					auto it = positions.find(entry.hash);
					if (it != positions.end())
					{
						auto& item = result[it->second];
						item.value = item.value + entry.value;
						item.raw_value = item.value.to_string();
						continue;
					}

					observed_transaction item;
					item.hash = entry.hash;
					item.chain = chain.id;
					item.address = target;
					item.to = target;
					item.value = entry.value;
					item.raw_value = entry.value.to_string();
					item.confirmations = entry.confirmations;
					item.direction = transfer_direction::incoming;
					item.block_time = entry.block_time;
					positions[item.hash] = result.size();
					result.emplace_back(std::move(item));
				}
				coreturn expects_rt<vector<observed_transaction>>(std::move(result));
			}
			expects_promise_rt<transaction_detail> utxo_fetcher::get_detail(const observed_transaction& item)
			{
				return node.get_transaction(item.hash);
			}
			const chain_descriptor& utxo_fetcher::get_chain() const
			{
				return node.get_chain();
			}

			utxo_estimator::utxo_estimator(node_client& new_node, uint64_t new_confirmation_target) noexcept : node(new_node), confirmation_target(new_confirmation_target)
			{
			}
			expects_promise_rt<decimal> utxo_estimator::estimate_network_fee(const std::string_view& to_address)
			{
				auto fee_rate = coawait(node.estimate_fee(confirmation_target));
				if (!fee_rate)
					coreturn expects_rt<decimal>(std::move(fee_rate.error()));

				decimal fee = *fee_rate * decimal(typical_transaction_size) / decimal(1000);
				coreturn expects_rt<decimal>(fee.truncate(node.get_chain().decimals));
			}
			expects_promise_rt<bool> utxo_estimator::is_activated(const std::string_view& address)
			{
				return expects_promise_rt<bool>(expects_rt<bool>(true));
			}
		}
	}
}
