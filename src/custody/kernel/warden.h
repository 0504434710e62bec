#ifndef CST_KERNEL_WARDEN_H
#define CST_KERNEL_WARDEN_H
#include "registry.h"
#include "../layer/control.h"

namespace custody
{
	namespace warden
	{
		enum class transfer_direction
		{
			incoming,
			outgoing,
			internal
		};

		struct http_request
		{
			string method = "GET";
			string url;
			string content_type;
			string body;
			string username;
			string password;
			size_t max_size = 16 * 1024 * 1024;
			uint64_t timeout = 3000;
			int32_t verify_peers = -1;
		};

		struct http_reply
		{
			int32_t status_code = 0;
			string content_type;
			string content;
		};

		struct value_transfer
		{
			string address;
			decimal value;

			value_transfer();
			value_transfer(const std::string_view& new_address, const decimal& new_value);
			uptr<schema> as_schema() const;
		};

		struct observed_transaction
		{
			string hash;
			string chain;
			string address;
			string from;
			string to;
			string raw_value;
			decimal value;
			uint64_t confirmations = 0;
			transfer_direction direction = transfer_direction::incoming;
			int64_t block_time = 0;

			uptr<schema> as_schema() const;
		};

		struct transaction_detail
		{
			string hash;
			string block_hash;
			decimal fee;
			uint64_t confirmations = 0;
			int64_t block_time = 0;
			vector<value_transfer> inputs;
			vector<value_transfer> outputs;

			transaction_detail();
			decimal paid_to(const std::string_view& address) const;
			vector<string> senders() const;
			vector<string> receivers() const;
			uptr<schema> as_schema() const;
			static transaction_detail from_observation(const observed_transaction& item);
		};

		struct blockchain_info
		{
			string chain;
			string best_block_hash;
			uint64_t blocks = 0;
			uint64_t headers = 0;
			double verification_progress = 0.0;
			bool initial_block_download = false;
		};

		struct unspent_output
		{
			string hash;
			string address;
			decimal value;
			uint64_t index = 0;
			uint64_t confirmations = 0;
		};

		struct wallet_entry
		{
			string hash;
			string address;
			string category;
			decimal value;
			uint64_t index = 0;
			uint64_t confirmations = 0;
			int64_t block_time = 0;
		};

		class http_channel
		{
		public:
			virtual ~http_channel() = default;
			virtual expects_promise_system<http_reply> fetch(http_request&& request) = 0;
		};

		class server_channel final : public http_channel
		{
		private:
			unordered_set<http::client*> activities;
			std::recursive_mutex mutex;
			std::atomic<bool> allowed;

		public:
			server_channel() noexcept;
			~server_channel() override;
			expects_promise_system<http_reply> fetch(http_request&& request) override;
			void allow_activities();
			void cancel_activities();
			bool is_activity_allowed() const;

		private:
			void add_activity(http::client* client);
			void remove_activity(http::client* client);
		};

		class server_relay
		{
		public:
			struct error_reporter
			{
				string type;
				string method;
			};

		private:
			vector<std::pair<promise<bool>, task_id>> tasks;
			std::recursive_mutex mutex;
			const protocol& params;
			http_channel* channel;
			scheduler* timers;
			cancellation_token token;
			string url;
			string username;
			string password;
			uint64_t latest;
			double rps;
			std::atomic<bool> allowed;

		public:
			server_relay(const protocol& new_params, http_channel* new_channel, scheduler* new_timers, const std::string_view& new_url, const std::string_view& new_username = std::string_view(), const std::string_view& new_password = std::string_view(), double new_rps = 0.0) noexcept;
			server_relay(const server_relay&) = delete;
			~server_relay() noexcept;
			server_relay& operator=(const server_relay&) = delete;
			expects_promise_rt<schema*> execute_rpc(error_reporter& reporter, const std::string_view& method, const schema_list& args, const std::string_view& path = std::string_view());
			expects_promise_rt<schema*> execute_rest(error_reporter& reporter, const std::string_view& method, const std::string_view& path, schema* args);
			expects_promise_rt<schema*> execute_http(error_reporter& reporter, const std::string_view& method, const std::string_view& path, const std::string_view& type, const std::string_view& body);
			promise<bool> yield_for_cooldown(uint64_t& retry_timeout, uint64_t total_timeout_ms);
			void allow_activities();
			void cancel_activities();
			bool is_activity_allowed() const;
			const string& get_node_url() const;
			string get_node_url(const std::string_view& path) const;

		public:
			static string generate_error_message(const http_reply* response, const error_reporter& reporter, const std::string_view& error_code, const std::string_view& error_message);
			static bool is_retryable(const http_reply& response);

		private:
			task_id enqueue_activity(const promise<bool>& future, task_id timer_id);
			void dequeue_activity(task_id timer_id);
		};

		class node_client
		{
		public:
			class nd_call
			{
			public:
				static const char* get_blockchain_info();
				static const char* load_wallet();
				static const char* create_wallet();
				static const char* import_address();
				static const char* list_transactions();
				static const char* list_unspent();
				static const char* get_transaction();
				static const char* get_raw_transaction();
				static const char* decode_raw_transaction();
				static const char* send_raw_transaction();
				static const char* estimate_smart_fee();
				static const char* rescan_blockchain();
			};

		private:
			server_relay& relay;
			const chain_descriptor& chain;
			std::atomic<bool> wallet_ready;

		public:
			node_client(server_relay& new_relay, const chain_descriptor& new_chain) noexcept;
			node_client(const node_client&) = delete;
			node_client& operator=(const node_client&) = delete;
			expects_promise_rt<schema*> call(const std::string_view& method, schema_list&& args);
			expects_promise_rt<schema*> call_wallet(const std::string_view& method, schema_list&& args);
			expects_promise_rt<void> ensure_wallet();
			expects_promise_rt<blockchain_info> get_blockchain_info();
			expects_promise_rt<bool> is_synced();
			expects_promise_rt<double> get_sync_progress();
			expects_promise_rt<void> import_watch_address(const std::string_view& address, const std::string_view& label, bool rescan);
			expects_promise_rt<vector<wallet_entry>> list_transactions(uint64_t count, uint64_t skip = 0);
			expects_promise_rt<vector<unspent_output>> list_unspent(const std::string_view& address, uint64_t min_confirmations);
			expects_promise_rt<decimal> get_balance(const std::string_view& address);
			expects_promise_rt<transaction_detail> get_transaction(const std::string_view& hash);
			expects_promise_rt<schema*> get_raw_transaction(const std::string_view& hash, bool verbose);
			expects_promise_rt<string> broadcast_raw(const std::string_view& raw_transaction);
			expects_promise_rt<decimal> estimate_fee(uint64_t confirmation_target);
			expects_promise_rt<void> rescan(uint64_t start_height);
			const string& get_wallet_name() const;
			const chain_descriptor& get_chain() const;
			bool is_wallet_ready() const;

		public:
			static bool has_error(const remote_exception& error, const std::string_view& needle);
			static unordered_set<string> get_output_addresses(schema* output);
		};

		enum class fetch_policy
		{
			cached,
			fresh
		};

		class transaction_fetcher
		{
		public:
			virtual ~transaction_fetcher() = default;
			virtual expects_promise_rt<vector<observed_transaction>> fetch(const std::string_view& address, fetch_policy policy) = 0;
			virtual expects_promise_rt<transaction_detail> get_detail(const observed_transaction& item) = 0;
			virtual const chain_descriptor& get_chain() const = 0;
		};

		class fee_estimator
		{
		public:
			virtual ~fee_estimator() = default;
			virtual expects_promise_rt<decimal> estimate_network_fee(const std::string_view& to_address) = 0;
			virtual expects_promise_rt<bool> is_activated(const std::string_view& address) = 0;
		};

		class fetcher_set
		{
		private:
			unordered_map<string, uptr<transaction_fetcher>> fetchers;
			unordered_map<string, uptr<fee_estimator>> estimators;

		public:
			fetcher_set() = default;
			fetcher_set(const fetcher_set&) = delete;
			fetcher_set& operator=(const fetcher_set&) = delete;
			void assign(const chain_descriptor& chain, uptr<transaction_fetcher>&& fetcher);
			void assign(const chain_descriptor& chain, uptr<fee_estimator>&& estimator);
			expects_lr<transaction_fetcher*> get_fetcher(const std::string_view& chain) const;
			fee_estimator* get_estimator(const std::string_view& chain) const;
			size_t size() const;
		};
	}
}
#endif
