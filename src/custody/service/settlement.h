#ifndef CST_SERVICE_SETTLEMENT_H
#define CST_SERVICE_SETTLEMENT_H
#include <deque>
#include "broadcaster.h"
#include "../kernel/registry.h"
#include "../kernel/warden.h"
#include "../policy/ledger.h"

namespace custody
{
	namespace settlement
	{
		struct fee_breakdown
		{
			decimal network_fee = decimal::zero();
			decimal activation_fee = decimal::zero();
			decimal service_fee = decimal::zero();
			decimal total = decimal::zero();

			uptr<schema> as_schema() const;
		};

		struct withdrawal_request
		{
			string user_id;
			string wallet_id;
			string chain;
			string currency;
			string to_address;
			string raw_transaction;
			decimal amount = decimal::zero();
		};

		struct withdrawal_receipt
		{
			ledger::persisted_transaction record;
			ledger::wallet_balance balance;
			fee_breakdown fees;
			bool internal = false;

			uptr<schema> as_schema() const;
		};

		class fee_calculator
		{
		private:
			const chain_registry& registry;
			warden::fetcher_set* estimators;

		public:
			fee_calculator(const chain_registry& new_registry, warden::fetcher_set* new_estimators = nullptr) noexcept;
			expects_promise_lr<fee_breakdown> compute_fee(const decimal& amount, const std::string_view& chain, const std::string_view& currency, const std::string_view& to_address);

		public:
			static decimal compute_service_fee(const decimal& amount, const fee_policy& policy);
		};

		class withdrawal_dispatcher
		{
		public:
			virtual ~withdrawal_dispatcher() = default;
			virtual expects_promise_rt<string> broadcast(const ledger::persisted_transaction& record) = 0;
		};

		class node_dispatcher final : public withdrawal_dispatcher
		{
		private:
			warden::node_client& node;

		public:
			node_dispatcher(warden::node_client& new_node) noexcept;
			expects_promise_rt<string> broadcast(const ledger::persisted_transaction& record) override;
		};

		class withdrawal_queue
		{
		private:
			const chain_registry& registry;
			fee_calculator& calculator;
			ledger::ledger_gateway& ledger;
			events::event_broadcaster& broadcaster;
			unordered_map<string, uptr<withdrawal_dispatcher>> dispatchers;
			unordered_set<string> busy_wallets;
			std::deque<string> queue;
			std::recursive_mutex mutex;
			bool logging;

		public:
			withdrawal_queue(const protocol& params, const chain_registry& new_registry, fee_calculator& new_calculator, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster) noexcept;
			withdrawal_queue(const withdrawal_queue&) = delete;
			withdrawal_queue& operator=(const withdrawal_queue&) = delete;
			void assign_dispatcher(const std::string_view& chain, uptr<withdrawal_dispatcher>&& dispatcher);
			expects_promise_lr<withdrawal_receipt> settle(const withdrawal_request& request);
			expects_lr<void> submit(const std::string_view& transaction_id);
			promise<size_t> dispatch();
			expects_lr<ledger::wallet_balance> reject(const std::string_view& transaction_id);
			size_t pending();

		public:
			static expects_lr<void> validate_address(const chain_descriptor& chain, const std::string_view& address);
			static expects_lr<void> validate_precision(const token_descriptor& token, const decimal& amount);

		private:
			expects_promise_rt<string> dispatch_one(const ledger::persisted_transaction& record);
			expects_lr<withdrawal_receipt> settle_internal(const withdrawal_request& request, const chain_descriptor& chain, const token_descriptor& token, const ledger::watched_address& recipient);
			withdrawal_dispatcher* get_dispatcher(const std::string_view& chain);
			bool acquire_wallet(const string& wallet_id);
			void release_wallet(const string& wallet_id);
		};
	}
}
#endif
