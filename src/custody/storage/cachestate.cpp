#include "cachestate.h"

namespace custody
{
	namespace storages
	{
		cachestate::cachestate(repository& new_database) noexcept : database(new_database)
		{
		}
		expects_lr<void> cachestate::set_cache(const std::string_view& key, uptr<schema>&& value, uint64_t expiration_seconds)
		{
			schema_list map;
			map.push_back(var::set::string(key));

			auto storage = get_storage();
			if (value)
			{
				map.push_back(var::set::string(schema::to_json(*value)));
				map.push_back(var::set::integer(now() + (int64_t)expiration_seconds));

				auto cursor = storage.emplace_query(__func__, "INSERT OR REPLACE INTO cache (key, message, expiration) VALUES (?, ?, ?)", &map);
				if (!cursor || cursor->error())
					return layer_exception(ledger::storage_util::error_of(cursor));
			}
			else
			{
				auto cursor = storage.emplace_query(__func__, "DELETE FROM cache WHERE key = ?", &map);
				if (!cursor || cursor->error())
					return layer_exception(ledger::storage_util::error_of(cursor));
			}

			return expectation::met;
		}
		expects_lr<schema*> cachestate::get_cache(const std::string_view& key)
		{
			schema_list map;
			map.push_back(var::set::string(key));
			map.push_back(var::set::integer(now()));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "SELECT message FROM cache WHERE key = ? AND expiration > ?", &map);
			if (!cursor || cursor->error_or_empty())
				return layer_exception(cursor && !cursor->error() ? string("cache miss") : ledger::storage_util::error_of(cursor));

			auto value = schema::from_json((*cursor)["message"].get().get_blob());
			if (!value)
				return layer_exception(std::move(value.error().message()));

			return *value;
		}
		expects_lr<size_t> cachestate::prune_cache()
		{
			schema_list map;
			map.push_back(var::set::integer(now()));

			auto storage = get_storage();
			auto cursor = storage.emplace_query(__func__, "DELETE FROM cache WHERE expiration <= ? RETURNING key", &map);
			if (!cursor || cursor->error())
				return layer_exception(ledger::storage_util::error_of(cursor));

			return cursor->first().size();
		}
		ledger::storage_index_ptr cachestate::get_storage()
		{
			return ledger::storage_index_ptr(&database, ledger::storage_util::index_storage_of(database, "cachestate", &cachestate::make_schema));
		}
		int64_t cachestate::now()
		{
			return (int64_t)(date_time().milliseconds() / 1000);
		}
		bool cachestate::make_schema(sqlite::connection* connection)
		{
			string command = VI_STRINGIFY(
			CREATE TABLE IF NOT EXISTS cache
			(
				key TEXT NOT NULL,
				message TEXT NOT NULL,
				expiration BIGINT NOT NULL,
				PRIMARY KEY (key)
			) WITHOUT ROWID;
			CREATE INDEX IF NOT EXISTS cache_expiration ON cache (expiration););

			auto cursor = connection->query(command);
			return cursor && !cursor->error();
		}
	}
}
