#include "ledgerstate.h"

namespace custody
{
	namespace storages
	{
		static decimal load_decimal(const string& value)
		{
			if (value.empty())
				return decimal::zero();

			return decimal(std::string_view(value));
		}
		template <typename row_type>
		static ledger::persisted_transaction load_transaction(row_type& row)
		{
			ledger::persisted_transaction value;
			value.id = row["id"].get().get_blob();
			value.hash = row["hash"].get().get_blob();
			value.wallet_id = row["wallet_id"].get().get_blob();
			value.chain = row["chain"].get().get_blob();
			value.currency = row["currency"].get().get_blob();
			value.address = row["address"].get().get_blob();
			value.type = ledger::ledger_util::type_of(row["type"].get().get_blob()).or_else(ledger::transaction_type::deposit);
			value.status = ledger::ledger_util::status_of(row["status"].get().get_blob()).or_else(ledger::transaction_status::pending);
			value.amount = load_decimal(row["amount"].get().get_blob());
			value.fee = load_decimal(row["fee"].get().get_blob());
			value.created_at = row["created_at"].get().get_integer();

			auto metadata = row["metadata"].get().get_blob();
			if (!metadata.empty())
			{
				auto data = schema::from_json(metadata);
				if (data)
					value.metadata = *data;
			}
			return value;
		}
		template <typename row_type>
		static ledger::wallet_balance load_balance(row_type& row)
		{
			ledger::wallet_balance value;
			value.id = row["id"].get().get_blob();
			value.user_id = row["user_id"].get().get_blob();
			value.currency = row["currency"].get().get_blob();
			value.balance = load_decimal(row["balance"].get().get_blob());
			value.in_order = load_decimal(row["in_order"].get().get_blob());
			return value;
		}

		ledgerstate::ledgerstate(repository& new_database) noexcept : database(new_database)
		{
		}
		expects_lr<option<ledger::persisted_transaction>> ledgerstate::find_transaction(const std::string_view& hash, const std::string_view& wallet_id)
		{
			schema_list map;
			map.push_back(var::set::string(hash));
			map.push_back(var::set::string(wallet_id));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT * FROM transactions WHERE hash = ? AND wallet_id = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			if (response.size() == 0)
				return option<ledger::persisted_transaction>(optional::none);

			auto row = response[0];
			return option<ledger::persisted_transaction>(load_transaction(row));
		}
		expects_lr<ledger::persisted_transaction> ledgerstate::get_transaction(const std::string_view& id)
		{
			schema_list map;
			map.push_back(var::set::string(id));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT * FROM transactions WHERE id = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			if (response.size() == 0)
				return layer_exception(stringify::text("transaction not found: %.*s", (int)id.size(), id.data()));

			auto row = response[0];
			return load_transaction(row);
		}
		expects_lr<bool> ledgerstate::create_transaction(const ledger::persisted_transaction& record)
		{
			if (!record.is_valid())
				return layer_exception("invalid transaction record");

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			if (!record.hash.empty())
			{
				auto exists = has_transaction(storage, record.hash, record.wallet_id);
				if (!exists)
					return exists.error();
				else if (*exists)
					return false;
			}

			auto status = store_transaction(storage, record);
			if (!status)
				return status.error();

			return true;
		}
		expects_lr<bool> ledgerstate::credit_deposit(const ledger::persisted_transaction& record)
		{
			if (!record.is_valid() || record.hash.empty())
				return layer_exception("invalid deposit record");

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto session = storage.tx_begin(__func__, sqlite::isolation::default_isolation);
			if (!session)
				return layer_exception(ledger::storage_util::error_of(session));

			auto exists = has_transaction(storage, record.hash, record.wallet_id);
			if (!exists)
				return rollback(storage, layer_exception(string(exists.what()))).error();
			else if (*exists)
			{
				storage.tx_rollback(__func__);
				return false;
			}

			auto wallet = load_wallet(storage, record.wallet_id);
			if (!wallet)
				return rollback(storage, layer_exception(string(wallet.what()))).error();

			wallet->balance = wallet->balance + record.amount;
			auto status = store_transaction(storage, record);
			if (status)
				status = store_balance(storage, *wallet);
			if (!status)
				return rollback(storage, layer_exception(string(status.what()))).error();

			auto commit = storage.tx_commit(__func__);
			if (!commit)
				return layer_exception(ledger::storage_util::error_of(commit));

			return true;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::debit(const std::string_view& wallet_id, const decimal& total, const ledger::persisted_transaction* record)
		{
			if (total.is_nan() || total.is_negative())
				return layer_exception("invalid debit amount");

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto session = storage.tx_begin(__func__, sqlite::isolation::default_isolation);
			if (!session)
				return layer_exception(ledger::storage_util::error_of(session));

			auto wallet = load_wallet(storage, wallet_id);
			if (!wallet)
				return rollback(storage, layer_exception(string(wallet.what()))).error();

			auto available = wallet->available();
			if (available < total)
			{
				auto error = layer_exception::insufficient_funds(stringify::text("available %s < required %s", available.to_string().c_str(), total.to_string().c_str()));
				return rollback(storage, std::move(error)).error();
			}

			wallet->balance = wallet->balance - total;
			auto status = store_balance(storage, *wallet);
			if (status && record != nullptr)
				status = store_transaction(storage, *record);
			if (!status)
				return rollback(storage, layer_exception(string(status.what()))).error();

			auto commit = storage.tx_commit(__func__);
			if (!commit)
				return layer_exception(ledger::storage_util::error_of(commit));

			return wallet;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::transfer(const ledger::persisted_transaction& outgoing, const ledger::persisted_transaction& incoming)
		{
			if (!outgoing.is_valid() || !incoming.is_valid())
				return layer_exception("invalid transfer records");
			else if (outgoing.wallet_id == incoming.wallet_id)
				return layer_exception("transfer to the same wallet");

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto session = storage.tx_begin(__func__, sqlite::isolation::default_isolation);
			if (!session)
				return layer_exception(ledger::storage_util::error_of(session));

			auto sender = load_wallet(storage, outgoing.wallet_id);
			if (!sender)
				return rollback(storage, layer_exception(string(sender.what()))).error();

			auto recipient = load_wallet(storage, incoming.wallet_id);
			if (!recipient)
				return rollback(storage, layer_exception(string(recipient.what()))).error();

			decimal total = outgoing.amount + outgoing.fee;
			auto available = sender->available();
			if (available < total)
			{
				auto error = layer_exception::insufficient_funds(stringify::text("available %s < required %s", available.to_string().c_str(), total.to_string().c_str()));
				return rollback(storage, std::move(error)).error();
			}

			sender->balance = sender->balance - total;
			recipient->balance = recipient->balance + incoming.amount;
			auto status = store_balance(storage, *sender);
			if (status)
				status = store_balance(storage, *recipient);
			if (status)
				status = store_transaction(storage, outgoing);
			if (status)
				status = store_transaction(storage, incoming);
			if (!status)
				return rollback(storage, layer_exception(string(status.what()))).error();

			auto commit = storage.tx_commit(__func__);
			if (!commit)
				return layer_exception(ledger::storage_util::error_of(commit));

			return sender;
		}
		expects_lr<void> ledgerstate::update_transaction(const ledger::persisted_transaction& record)
		{
			schema_list map;
			map.push_back(record.hash.empty() ? var::set::null() : var::set::string(record.hash));
			map.push_back(var::set::string(ledger::ledger_util::status_name(record.status)));
			map.push_back(var::set::string(record.fee.to_string()));
			map.push_back(record.metadata ? var::set::string(schema::to_json(*record.metadata)) : var::set::null());
			map.push_back(var::set::string(record.id));

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "UPDATE transactions SET hash = ?, status = ?, fee = ?, metadata = ? WHERE id = ?", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return expectation::met;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::refund(const std::string_view& transaction_id)
		{
			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto session = storage.tx_begin(__func__, sqlite::isolation::default_isolation);
			if (!session)
				return layer_exception(ledger::storage_util::error_of(session));

			schema_list map;
			map.push_back(var::set::string(transaction_id));

			auto cursor = storage.emplace_query(__func__, "SELECT * FROM transactions WHERE id = ? LIMIT 1", &map);
			if (!cursor || cursor->error() || cursor->first().size() == 0)
			{
				auto error = layer_exception(cursor && !cursor->error() ? stringify::text("transaction not found: %.*s", (int)transaction_id.size(), transaction_id.data()) : ledger::storage_util::error_of(cursor));
				return rollback(storage, std::move(error)).error();
			}

			auto row = cursor->first()[0];
			auto record = load_transaction(row);
			if (record.type != ledger::transaction_type::withdraw || record.status != ledger::transaction_status::pending)
			{
				storage.tx_rollback(__func__);
				return layer_exception(stringify::text("transaction %s is not a pending withdrawal", record.id.c_str()));
			}

			auto wallet = load_wallet(storage, record.wallet_id);
			if (!wallet)
				return rollback(storage, layer_exception(string(wallet.what()))).error();

			record.status = ledger::transaction_status::failed;
			wallet->balance = wallet->balance + record.amount + record.fee;

			map.clear();
			map.push_back(var::set::string(ledger::ledger_util::status_name(record.status)));
			map.push_back(var::set::string(record.id));
			cursor = storage.emplace_query(__func__, "UPDATE transactions SET status = ? WHERE id = ?", &map);
			if (!cursor || cursor->error())
			{
				auto error = layer_exception(ledger::storage_util::error_of(cursor));
				return rollback(storage, std::move(error)).error();
			}

			auto status = store_balance(storage, *wallet);
			if (!status)
				return rollback(storage, layer_exception(string(status.what()))).error();

			auto commit = storage.tx_commit(__func__);
			if (!commit)
				return layer_exception(ledger::storage_util::error_of(commit));

			return wallet;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::get_wallet(const std::string_view& wallet_id)
		{
			auto storage = get_storage();
			return load_wallet(storage, wallet_id);
		}
		expects_lr<option<ledger::wallet_balance>> ledgerstate::find_wallet(const std::string_view& user_id, const std::string_view& currency)
		{
			schema_list map;
			map.push_back(var::set::string(user_id));
			map.push_back(var::set::string(currency));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT * FROM wallets WHERE user_id = ? AND currency = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			if (response.size() == 0)
				return option<ledger::wallet_balance>(optional::none);

			auto row = response[0];
			return option<ledger::wallet_balance>(load_balance(row));
		}
		expects_lr<option<ledger::watched_address>> ledgerstate::find_address(const std::string_view& chain, const std::string_view& address)
		{
			schema_list map;
			map.push_back(var::set::string(chain));
			map.push_back(var::set::string(address));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT wallet_id, chain, address FROM addresses WHERE chain = ? AND address = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			if (response.size() == 0)
				return option<ledger::watched_address>(optional::none);

			auto row = response[0];
			ledger::watched_address value;
			value.wallet_id = row["wallet_id"].get().get_blob();
			value.chain = row["chain"].get().get_blob();
			value.address = row["address"].get().get_blob();
			return option<ledger::watched_address>(std::move(value));
		}
		expects_lr<vector<ledger::watched_address>> ledgerstate::get_addresses()
		{
			auto storage = get_storage();
			auto cursor = storage.query(__func__, "SELECT wallet_id, chain, address FROM addresses ORDER BY chain, address");
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			size_t size = response.size();
			vector<ledger::watched_address> values;
			values.reserve(size);
			for (size_t i = 0; i < size; i++)
			{
				auto row = response[i];
				ledger::watched_address value;
				value.wallet_id = row["wallet_id"].get().get_blob();
				value.chain = row["chain"].get().get_blob();
				value.address = row["address"].get().get_blob();
				values.emplace_back(std::move(value));
			}
			return values;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::create_wallet(const std::string_view& user_id, const std::string_view& currency, const decimal& balance)
		{
			ledger::wallet_balance wallet;
			wallet.id = ledger::ledger_util::generate_id();
			wallet.user_id = user_id;
			wallet.currency = currency;
			wallet.balance = balance;

			schema_list map;
			map.push_back(var::set::string(wallet.id));
			map.push_back(var::set::string(wallet.user_id));
			map.push_back(var::set::string(wallet.currency));
			map.push_back(var::set::string(wallet.balance.to_string()));
			map.push_back(var::set::string(wallet.in_order.to_string()));

			umutex<std::mutex> unique(balance_mutex);
			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "INSERT INTO wallets (id, user_id, currency, balance, in_order) VALUES (?, ?, ?, ?, ?)", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return wallet;
		}
		expects_lr<void> ledgerstate::assign_address(const std::string_view& wallet_id, const std::string_view& chain, const std::string_view& address)
		{
			schema_list map;
			map.push_back(var::set::string(wallet_id));
			map.push_back(var::set::string(chain));
			map.push_back(var::set::string(address));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "INSERT OR REPLACE INTO addresses (wallet_id, chain, address) VALUES (?, ?, ?)", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return expectation::met;
		}
		expects_lr<vector<ledger::persisted_transaction>> ledgerstate::get_transactions(const std::string_view& wallet_id, ledger::transaction_status status)
		{
			schema_list map;
			map.push_back(var::set::string(wallet_id));
			map.push_back(var::set::string(ledger::ledger_util::status_name(status)));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT * FROM transactions WHERE wallet_id = ? AND status = ? ORDER BY created_at ASC", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			size_t size = response.size();
			vector<ledger::persisted_transaction> values;
			values.reserve(size);
			for (size_t i = 0; i < size; i++)
			{
				auto row = response[i];
				values.emplace_back(load_transaction(row));
			}
			return values;
		}
		ledger::storage_index_ptr ledgerstate::get_storage()
		{
			return ledger::storage_index_ptr(&database, ledger::storage_util::index_storage_of(database, "ledgerstate", &ledgerstate::make_schema));
		}
		expects_lr<bool> ledgerstate::has_transaction(ledger::storage_index_ptr& storage, const std::string_view& hash, const std::string_view& wallet_id)
		{
			schema_list map;
			map.push_back(var::set::string(hash));
			map.push_back(var::set::string(wallet_id));

			auto cursor = storage.emplace_query(__func__, "SELECT id FROM transactions WHERE hash = ? AND wallet_id = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return cursor->first().size() > 0;
		}
		expects_lr<ledger::wallet_balance> ledgerstate::load_wallet(ledger::storage_index_ptr& storage, const std::string_view& wallet_id)
		{
			schema_list map;
			map.push_back(var::set::string(wallet_id));

			auto cursor = storage.emplace_query(__func__, "SELECT * FROM wallets WHERE id = ? LIMIT 1", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			auto response = cursor->first();
			if (response.size() == 0)
				return layer_exception(stringify::text("wallet not found: %.*s", (int)wallet_id.size(), wallet_id.data()));

			auto row = response[0];
			return load_balance(row);
		}
		expects_lr<void> ledgerstate::store_balance(ledger::storage_index_ptr& storage, const ledger::wallet_balance& wallet)
		{
			schema_list map;
			map.push_back(var::set::string(wallet.balance.to_string()));
			map.push_back(var::set::string(wallet.in_order.to_string()));
			map.push_back(var::set::string(wallet.id));

			auto cursor = storage.emplace_query(__func__, "UPDATE wallets SET balance = ?, in_order = ? WHERE id = ?", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return expectation::met;
		}
		expects_lr<void> ledgerstate::store_transaction(ledger::storage_index_ptr& storage, const ledger::persisted_transaction& record)
		{
			schema_list map;
			map.push_back(var::set::string(record.id));
			map.push_back(record.hash.empty() ? var::set::null() : var::set::string(record.hash));
			map.push_back(var::set::string(record.wallet_id));
			map.push_back(var::set::string(ledger::ledger_util::type_name(record.type)));
			map.push_back(var::set::string(ledger::ledger_util::status_name(record.status)));
			map.push_back(var::set::string(record.amount.to_string()));
			map.push_back(var::set::string(record.fee.to_string()));
			map.push_back(var::set::string(record.chain));
			map.push_back(var::set::string(record.currency));
			map.push_back(var::set::string(record.address));
			map.push_back(record.metadata ? var::set::string(schema::to_json(*record.metadata)) : var::set::null());
			map.push_back(var::set::integer(record.created_at > 0 ? record.created_at : ledger::ledger_util::timestamp()));

			auto cursor = storage.emplace_query(__func__, "INSERT INTO transactions (id, hash, wallet_id, type, status, amount, fee, chain, currency, address, metadata, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return expectation::met;
		}
		expects_lr<void> ledgerstate::rollback(ledger::storage_index_ptr& storage, layer_exception&& error)
		{
			auto status = storage.tx_rollback("ledgerstate");
			if (!status)
				return layer_exception(error.message() + "; " + ledger::storage_util::error_of(status));

			return error;
		}
		bool ledgerstate::make_schema(sqlite::connection* connection)
		{
			string command = VI_STRINGIFY(
			CREATE TABLE IF NOT EXISTS wallets
			(
				id TEXT NOT NULL,
				user_id TEXT NOT NULL,
				currency TEXT NOT NULL,
				balance TEXT NOT NULL,
				in_order TEXT NOT NULL,
				PRIMARY KEY (id),
				UNIQUE (user_id, currency)
			) WITHOUT ROWID;
			CREATE TABLE IF NOT EXISTS addresses
			(
				wallet_id TEXT NOT NULL,
				chain TEXT NOT NULL,
				address TEXT NOT NULL,
				PRIMARY KEY (chain, address)
			) WITHOUT ROWID;
			CREATE INDEX IF NOT EXISTS addresses_wallet_id ON addresses (wallet_id);
			CREATE TABLE IF NOT EXISTS transactions
			(
				id TEXT NOT NULL,
				hash TEXT,
				wallet_id TEXT NOT NULL,
				type TEXT NOT NULL,
				status TEXT NOT NULL,
				amount TEXT NOT NULL,
				fee TEXT NOT NULL,
				chain TEXT NOT NULL,
				currency TEXT NOT NULL,
				address TEXT NOT NULL,
				metadata TEXT,
				created_at BIGINT NOT NULL,
				PRIMARY KEY (id),
				UNIQUE (hash, wallet_id)
			) WITHOUT ROWID;
			CREATE INDEX IF NOT EXISTS transactions_wallet_id_status ON transactions (wallet_id, status););

			auto cursor = connection->query(command);
			return cursor && !cursor->error();
		}
	}
}
