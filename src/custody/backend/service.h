#ifndef CST_WARDEN_SERVICE_H
#define CST_WARDEN_SERVICE_H
#include "../kernel/warden.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			class tron_fetcher final : public transaction_fetcher
			{
			private:
				server_relay& relay;
				const chain_descriptor& chain;

			public:
				tron_fetcher(server_relay& new_relay, const chain_descriptor& new_chain) noexcept;
				expects_promise_rt<vector<observed_transaction>> fetch(const std::string_view& address, fetch_policy policy) override;
				expects_promise_rt<transaction_detail> get_detail(const observed_transaction& item) override;
				const chain_descriptor& get_chain() const override;
				expects_rt<vector<observed_transaction>> parse_transactions(const std::string_view& address, schema* data) const;

			public:
				static expects_lr<string> get_host(const chain_descriptor& chain);
			};

			class tron_estimator final : public fee_estimator
			{
			public:
				static constexpr uint64_t typical_bandwidth = 267;

			private:
				server_relay& relay;
				const chain_descriptor& chain;

			public:
				tron_estimator(server_relay& new_relay, const chain_descriptor& new_chain) noexcept;
				expects_promise_rt<decimal> estimate_network_fee(const std::string_view& to_address) override;
				expects_promise_rt<bool> is_activated(const std::string_view& address) override;
			};

			class monero_estimator final : public fee_estimator
			{
			public:
				static constexpr uint64_t typical_transaction_weight = 1500;

			private:
				server_relay& relay;
				const chain_descriptor& chain;

			public:
				monero_estimator(server_relay& new_relay, const chain_descriptor& new_chain) noexcept;
				expects_promise_rt<decimal> estimate_network_fee(const std::string_view& to_address) override;
				expects_promise_rt<bool> is_activated(const std::string_view& address) override;
			};
		}
	}
}
#endif
