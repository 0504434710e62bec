#ifndef CST_STORAGE_CACHESTATE_H
#define CST_STORAGE_CACHESTATE_H
#include "engine.h"

namespace custody
{
	namespace storages
	{
		class cachestate
		{
		private:
			repository& database;

		public:
			cachestate(repository& new_database) noexcept;
			expects_lr<void> set_cache(const std::string_view& key, uptr<schema>&& value, uint64_t expiration_seconds);
			expects_lr<schema*> get_cache(const std::string_view& key);
			expects_lr<size_t> prune_cache();

		private:
			ledger::storage_index_ptr get_storage();

		private:
			static int64_t now();
			static bool make_schema(sqlite::connection* connection);
		};
	}
}
#endif
