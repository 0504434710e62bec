#include "engine.h"

namespace custody
{
	namespace ledger
	{
		uref<sqlite::connection> storage_util::index_storage_of(repository& database, const std::string_view& location, const std::function<bool(sqlite::connection*)>& callback)
		{
			auto connection = database.pull_index(location, [&location, &callback](sqlite::connection* connection)
			{
				VI_PANIC(callback(connection), "index configuration error (path: %.*s)", (int)location.size(), location.data());
			});
			VI_PANIC(connection, "index connection error (path: %.*s)", (int)location.size(), location.data());
			return connection;
		}
		string storage_util::error_of(sqlite::expects_db<sqlite::session_id>& cursor)
		{
			string error;
			if (!cursor)
				error = cursor.what();
			return error;
		}
		string storage_util::error_of(sqlite::expects_db<void>& cursor)
		{
			string error;
			if (!cursor)
				error = cursor.what();
			return error;
		}
		string storage_util::error_of(sqlite::expects_db<sqlite::cursor>& cursor)
		{
			string error;
			if (cursor)
			{
				if (cursor->error())
				{
					for (auto& response : *cursor)
					{
						if (response.error())
						{
							if (!error.empty())
								error += "; ";
							error += response.get_status_text();
						}
					}
				}
			}
			else
				error = cursor.what();
			return error;
		}

		storage_index_ptr::storage_index_ptr() : database(nullptr), invocations(0), transaction(false)
		{
		}
		storage_index_ptr::storage_index_ptr(repository* new_database, uref<sqlite::connection>&& new_connection) : connection(std::move(new_connection)), database(new_database), invocations(0), transaction(false)
		{
			VI_PANIC(connection && database, "index connection required");
		}
		storage_index_ptr::storage_index_ptr(storage_index_ptr&& other) noexcept : connection(std::move(other.connection)), database(other.database), invocations(other.invocations), transaction(other.transaction)
		{
			other.database = nullptr;
			other.invocations = 0;
			other.transaction = false;
		}
		storage_index_ptr::~storage_index_ptr()
		{
			if (!connection)
				return;

			if (transaction)
				tx_rollback("release");
			if (database != nullptr)
				database->push_index(std::move(connection));
		}
		storage_index_ptr& storage_index_ptr::operator=(storage_index_ptr&& other) noexcept
		{
			if (this == &other)
				return *this;

			this->~storage_index_ptr();
			connection = std::move(other.connection);
			database = other.database;
			invocations = other.invocations;
			transaction = other.transaction;
			other.database = nullptr;
			other.invocations = 0;
			other.transaction = false;
			return *this;
		}
		sqlite::expects_db<void> storage_index_ptr::tx_begin(const std::string_view& operation, sqlite::isolation type)
		{
			if (transaction)
				return sqlite::database_exception("rollback or commit current transaction");

			VI_ASSERT(connection, "connection not initialized (transaction begin)");
			auto cursor = connection->tx_begin(type);
#ifndef NDEBUG
			string error = storage_util::error_of(cursor);
			if (!error.empty() && logging())
				VI_ERR("index storage operation %.*s error (transaction begin): %s", (int)operation.size(), operation.data(), error.c_str());
#endif
			++invocations;
			if (!cursor)
				return cursor.error();

			transaction = true;
			return expectation::met;
		}
		sqlite::expects_db<void> storage_index_ptr::tx_commit(const std::string_view& operation)
		{
			if (!transaction)
				return sqlite::database_exception("current transaction not found");

			VI_ASSERT(connection, "connection not initialized (transaction commit)");
			auto cursor = connection->tx_commit(connection->get_connection());
#ifndef NDEBUG
			string error = storage_util::error_of(cursor);
			if (!error.empty() && logging())
				VI_ERR("index storage operation %.*s error (transaction commit): %s", (int)operation.size(), operation.data(), error.c_str());
#endif
			++invocations;
			transaction = false;
			return cursor;
		}
		sqlite::expects_db<void> storage_index_ptr::tx_rollback(const std::string_view& operation)
		{
			if (!transaction)
				return sqlite::database_exception("current transaction not found");

			VI_ASSERT(connection, "connection not initialized (transaction rollback)");
			auto cursor = connection->tx_rollback(connection->get_connection());
#ifndef NDEBUG
			string error = storage_util::error_of(cursor);
			if (!error.empty() && logging())
				VI_ERR("index storage operation %.*s error (transaction rollback): %s", (int)operation.size(), operation.data(), error.c_str());
#endif
			++invocations;
			transaction = false;
			return cursor;
		}
		sqlite::expects_db<sqlite::cursor> storage_index_ptr::query(const std::string_view& operation, const std::string_view& command, size_t query_ops)
		{
			VI_ASSERT(connection, "connection not initialized (operation: %.*s)", (int)operation.size(), operation.data());
			auto cursor = connection->query(command, query_ops, transaction ? connection->get_connection() : nullptr);
#ifndef NDEBUG
			string error = storage_util::error_of(cursor);
			if (!error.empty() && logging())
				VI_ERR("index storage operation %.*s failed: %s", (int)operation.size(), operation.data(), error.c_str());
#endif
			++invocations;
			return cursor;
		}
		sqlite::expects_db<sqlite::cursor> storage_index_ptr::emplace_query(const std::string_view& operation, const std::string_view& command, schema_list* map, size_t query_ops)
		{
			VI_ASSERT(connection, "connection not initialized (operation: %.*s)", (int)operation.size(), operation.data());
			auto cursor = connection->emplace_query(command, map, query_ops, transaction ? connection->get_connection() : nullptr);
#ifndef NDEBUG
			string error = storage_util::error_of(cursor);
			if (!error.empty() && logging())
				VI_ERR("index storage operation %.*s failed: %s", (int)operation.size(), operation.data(), error.c_str());
#endif
			++invocations;
			return cursor;
		}
		sqlite::connection* storage_index_ptr::ptr() const
		{
			return *connection;
		}
		uint32_t storage_index_ptr::uses() const
		{
			return invocations;
		}
		bool storage_index_ptr::in_transaction() const
		{
			return transaction;
		}
		bool storage_index_ptr::may_use() const
		{
			return !!connection;
		}
		bool storage_index_ptr::logging() const
		{
			return database != nullptr && database->params().user.storage.logging;
		}
	}
}
