#ifndef CST_POLICY_LEDGER_H
#define CST_POLICY_LEDGER_H
#include "../kernel/chain.h"

namespace custody
{
	namespace ledger
	{
		enum class transaction_status
		{
			pending,
			confirmed,
			failed
		};

		enum class transaction_type
		{
			deposit,
			withdraw,
			incoming_transfer,
			outgoing_transfer
		};

		struct persisted_transaction
		{
			string id;
			string hash;
			string wallet_id;
			string chain;
			string currency;
			string address;
			transaction_type type = transaction_type::deposit;
			transaction_status status = transaction_status::pending;
			decimal amount = decimal::zero();
			decimal fee = decimal::zero();
			uptr<schema> metadata;
			int64_t created_at = 0;

			persisted_transaction() = default;
			persisted_transaction(const persisted_transaction& other);
			persisted_transaction(persisted_transaction&&) noexcept = default;
			persisted_transaction& operator=(const persisted_transaction& other);
			persisted_transaction& operator=(persisted_transaction&&) noexcept = default;
			uptr<schema> as_schema() const;
			bool is_valid() const;
		};

		struct wallet_balance
		{
			string id;
			string user_id;
			string currency;
			decimal balance = decimal::zero();
			decimal in_order = decimal::zero();

			decimal available() const;
			uptr<schema> as_schema() const;
		};

		struct watched_address
		{
			string wallet_id;
			string chain;
			string address;
		};

		class ledger_gateway
		{
		public:
			virtual ~ledger_gateway() = default;
			virtual expects_lr<option<persisted_transaction>> find_transaction(const std::string_view& hash, const std::string_view& wallet_id) = 0;
			virtual expects_lr<persisted_transaction> get_transaction(const std::string_view& id) = 0;
			virtual expects_lr<bool> create_transaction(const persisted_transaction& record) = 0;
			virtual expects_lr<bool> credit_deposit(const persisted_transaction& record) = 0;
			virtual expects_lr<wallet_balance> debit(const std::string_view& wallet_id, const decimal& total, const persisted_transaction* record) = 0;
			virtual expects_lr<wallet_balance> transfer(const persisted_transaction& outgoing, const persisted_transaction& incoming) = 0;
			virtual expects_lr<void> update_transaction(const persisted_transaction& record) = 0;
			virtual expects_lr<wallet_balance> refund(const std::string_view& transaction_id) = 0;
			virtual expects_lr<wallet_balance> get_wallet(const std::string_view& wallet_id) = 0;
			virtual expects_lr<option<wallet_balance>> find_wallet(const std::string_view& user_id, const std::string_view& currency) = 0;
			virtual expects_lr<option<watched_address>> find_address(const std::string_view& chain, const std::string_view& address) = 0;
			virtual expects_lr<vector<watched_address>> get_addresses() = 0;
		};

		class ledger_util
		{
		public:
			static std::string_view status_name(transaction_status status);
			static std::string_view type_name(transaction_type type);
			static option<transaction_status> status_of(const std::string_view& name);
			static option<transaction_type> type_of(const std::string_view& name);
			static uint32_t decimal_places_of(const decimal& value);
			static string generate_id();
			static int64_t timestamp();
		};
	}
}
#endif
