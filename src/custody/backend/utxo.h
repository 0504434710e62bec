#ifndef CST_WARDEN_UTXO_H
#define CST_WARDEN_UTXO_H
#include "../kernel/warden.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			class utxo_fetcher final : public transaction_fetcher
			{
			private:
				node_client& node;
				uint64_t history_size;

			public:
				utxo_fetcher(node_client& new_node, uint64_t new_history_size) noexcept;
				expects_promise_rt<vector<observed_transaction>> fetch(const std::string_view& address, fetch_policy policy) override;
				expects_promise_rt<transaction_detail> get_detail(const observed_transaction& item) override;
				const chain_descriptor& get_chain() const override;
			};

			class utxo_estimator final : public fee_estimator
			{
			public:
				static constexpr uint64_t typical_transaction_size = 250;

			private:
				node_client& node;
				uint64_t confirmation_target;

			public:
				utxo_estimator(node_client& new_node, uint64_t new_confirmation_target = 6) noexcept;
				expects_promise_rt<decimal> estimate_network_fee(const std::string_view& to_address) override;
				expects_promise_rt<bool> is_activated(const std::string_view& address) override;
			};
		}
	}
}
#endif
