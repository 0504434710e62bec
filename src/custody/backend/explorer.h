#ifndef CST_WARDEN_EXPLORER_H
#define CST_WARDEN_EXPLORER_H
#include "../kernel/warden.h"
#include "../storage/cachestate.h"

namespace custody
{
	namespace warden
	{
		namespace backends
		{
			class explorer_fetcher final : public transaction_fetcher
			{
			private:
				server_relay& relay;
				storages::cachestate* cache;
				const chain_descriptor& chain;
				uint64_t cache_expiration;
				bool logging;

			public:
				explorer_fetcher(server_relay& new_relay, storages::cachestate* new_cache, const chain_descriptor& new_chain, uint64_t new_cache_expiration, bool new_logging) noexcept;
				expects_promise_rt<vector<observed_transaction>> fetch(const std::string_view& address, fetch_policy policy) override;
				expects_promise_rt<transaction_detail> get_detail(const observed_transaction& item) override;
				const chain_descriptor& get_chain() const override;
				expects_rt<vector<observed_transaction>> parse_transactions(const std::string_view& address, schema* data) const;

			public:
				static expects_lr<string> get_url(const chain_descriptor& chain, const std::string_view& address);
				static string get_cache_key(const chain_descriptor& chain, const std::string_view& address);

			private:
				vector<observed_transaction> load_cache(const std::string_view& address, const string& key);
				void store_cache(const string& key, const vector<observed_transaction>& transactions);
			};
		}
	}
}
#endif
