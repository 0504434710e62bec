#ifndef CST_STORAGE_ENGINE_H
#define CST_STORAGE_ENGINE_H
#include "../kernel/chain.h"

namespace custody
{
	namespace ledger
	{
		class storage_util
		{
		public:
			static uref<sqlite::connection> index_storage_of(repository& database, const std::string_view& location, const std::function<bool(sqlite::connection*)>& callback);
			static string error_of(sqlite::expects_db<sqlite::session_id>& cursor);
			static string error_of(sqlite::expects_db<void>& cursor);
			static string error_of(sqlite::expects_db<sqlite::cursor>& cursor);
		};

		struct storage_index_ptr
		{
		private:
			uref<sqlite::connection> connection;
			repository* database;
			uint32_t invocations;
			bool transaction;

		public:
			storage_index_ptr();
			storage_index_ptr(repository* new_database, uref<sqlite::connection>&& new_connection);
			storage_index_ptr(const storage_index_ptr&) = delete;
			storage_index_ptr(storage_index_ptr&& other) noexcept;
			~storage_index_ptr();
			storage_index_ptr& operator=(const storage_index_ptr&) = delete;
			storage_index_ptr& operator=(storage_index_ptr&& other) noexcept;
			sqlite::expects_db<void> tx_begin(const std::string_view& operation, sqlite::isolation type);
			sqlite::expects_db<void> tx_commit(const std::string_view& operation);
			sqlite::expects_db<void> tx_rollback(const std::string_view& operation);
			sqlite::expects_db<sqlite::cursor> query(const std::string_view& operation, const std::string_view& command, size_t query_ops = 0);
			sqlite::expects_db<sqlite::cursor> emplace_query(const std::string_view& operation, const std::string_view& command, schema_list* map, size_t query_ops = 0);
			sqlite::connection* ptr() const;
			uint32_t uses() const;
			bool in_transaction() const;
			bool may_use() const;

		private:
			bool logging() const;
		};
	}
}
#endif
