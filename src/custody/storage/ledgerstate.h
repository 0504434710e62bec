#ifndef CST_STORAGE_LEDGERSTATE_H
#define CST_STORAGE_LEDGERSTATE_H
#include "engine.h"
#include "../policy/ledger.h"

namespace custody
{
	namespace storages
	{
		class ledgerstate final : public ledger::ledger_gateway
		{
		private:
			repository& database;
			std::mutex balance_mutex;

		public:
			ledgerstate(repository& new_database) noexcept;
			expects_lr<option<ledger::persisted_transaction>> find_transaction(const std::string_view& hash, const std::string_view& wallet_id) override;
			expects_lr<ledger::persisted_transaction> get_transaction(const std::string_view& id) override;
			expects_lr<bool> create_transaction(const ledger::persisted_transaction& record) override;
			expects_lr<bool> credit_deposit(const ledger::persisted_transaction& record) override;
			expects_lr<ledger::wallet_balance> debit(const std::string_view& wallet_id, const decimal& total, const ledger::persisted_transaction* record) override;
			expects_lr<ledger::wallet_balance> transfer(const ledger::persisted_transaction& outgoing, const ledger::persisted_transaction& incoming) override;
			expects_lr<void> update_transaction(const ledger::persisted_transaction& record) override;
			expects_lr<ledger::wallet_balance> refund(const std::string_view& transaction_id) override;
			expects_lr<ledger::wallet_balance> get_wallet(const std::string_view& wallet_id) override;
			expects_lr<option<ledger::wallet_balance>> find_wallet(const std::string_view& user_id, const std::string_view& currency) override;
			expects_lr<option<ledger::watched_address>> find_address(const std::string_view& chain, const std::string_view& address) override;
			expects_lr<vector<ledger::watched_address>> get_addresses() override;
			expects_lr<ledger::wallet_balance> create_wallet(const std::string_view& user_id, const std::string_view& currency, const decimal& balance = decimal::zero());
			expects_lr<void> assign_address(const std::string_view& wallet_id, const std::string_view& chain, const std::string_view& address);
			expects_lr<vector<ledger::persisted_transaction>> get_transactions(const std::string_view& wallet_id, ledger::transaction_status status);

		private:
			ledger::storage_index_ptr get_storage();
			expects_lr<bool> has_transaction(ledger::storage_index_ptr& storage, const std::string_view& hash, const std::string_view& wallet_id);
			expects_lr<ledger::wallet_balance> load_wallet(ledger::storage_index_ptr& storage, const std::string_view& wallet_id);
			expects_lr<void> store_balance(ledger::storage_index_ptr& storage, const ledger::wallet_balance& wallet);
			expects_lr<void> store_transaction(ledger::storage_index_ptr& storage, const ledger::persisted_transaction& record);
			expects_lr<void> rollback(ledger::storage_index_ptr& storage, layer_exception&& error);

		private:
			static bool make_schema(sqlite::connection* connection);
		};
	}
}
#endif
