#ifndef CST_KERNEL_CHAIN_H
#define CST_KERNEL_CHAIN_H
#include <vitex/compute.h>
#include <vitex/layer.h>
#include <vitex/network/http.h>
#include <vitex/network/sqlite.h>
#include <vitex/vitex.h>

namespace custody
{
	using namespace vitex::core;
	using namespace vitex::compute;
	using namespace vitex::layer;
	using namespace vitex::network;

	enum class network_type
	{
		regtest,
		testnet,
		mainnet
	};

	enum class storage_optimization
	{
		safety,
		speed
	};

	class layer_exception : public std::exception
	{
	private:
		string error_message;

	public:
		layer_exception();
		layer_exception(string&& text);
		const char* what() const noexcept override;
		string&& message() noexcept;
		static layer_exception insufficient_funds(const std::string_view& details);
		static layer_exception precision_exceeded(const std::string_view& details);
		static layer_exception unsupported_chain(const std::string_view& chain);
		static layer_exception invalid_address(const std::string_view& details);
	};

	class remote_exception : public std::exception
	{
	private:
		string error_message;
		int8_t error_status;

	public:
		remote_exception(string&& text);
		const char* what() const noexcept override;
		string&& message() noexcept;
		bool is_retry() const noexcept;
		bool is_shutdown() const noexcept;
		static remote_exception retry();
		static remote_exception shutdown();
		static remote_exception transient(string&& text);

	private:
		remote_exception(int8_t new_status);
	};

	template <typename v>
	using expects_lr = expects<v, layer_exception>;

	template <typename v>
	using expects_promise_lr = expects_promise<v, layer_exception>;

	template <typename v>
	using expects_rt = expects<v, remote_exception>;

	template <typename v>
	using expects_promise_rt = expects_promise<v, remote_exception>;

	class protocol;

	class repository
	{
		friend class protocol;

	private:
		unordered_map<string, single_queue<uref<sqlite::connection>>> indices;
		std::mutex mutex;
		string target_path;
		protocol* owner;

	public:
		repository(protocol* new_owner) noexcept;
		uref<sqlite::connection> pull_index(const std::string_view& location, std::function<void(sqlite::connection*)>&& initializer);
		void push_index(uref<sqlite::connection>&& connection);
		void reset();
		void checkpoint();
		const string& resolve(network_type type, const std::string_view& path);
		const string location() const;
		const protocol& params() const;
	};

	class protocol
	{
	public:
		struct logger
		{
			std::recursive_mutex mutex;
			uptr<stream> resource;
			int64_t repack_time = 0;
			uint64_t archive_size = 8 * 1024 * 1024;
			uint64_t archive_repack_interval = 1800;

			void output(const std::string_view& message);
		};

		struct node_config
		{
			string host = "127.0.0.1";
			uint16_t port = 0;
			string username;
			string password;
			string wallet = "ecosystem_wallets";
		};

		struct chain_config
		{
			node_config node;
			string network;
			string explorer_api_key;
			uint64_t confirmations = 0;
			double rps = 0.0;
			bool rescan_on_watch = false;
		};

		struct token_config
		{
			decimal fee_percentage = decimal::zero();
			decimal fee_minimum = decimal::zero();
			uint8_t decimals = 0;
			int16_t precision = -1;
		};

	public:
		struct user_dynamic_config
		{
			struct
			{
				uint64_t polling_interval = 30000;
				uint64_t max_backoff = 300000;
				uint64_t max_consecutive_errors = 5;
				uint64_t required_confirmations = 3;
				uint64_t history_size = 100;
				bool logging = true;
			} monitor;
			struct
			{
				uint64_t timeout = 3000;
				uint64_t retry_timeout = 300;
				uint64_t max_retries = 5;
				uint64_t max_response_size = 16 * 1024 * 1024;
				bool logging = true;
			} relay;
			struct
			{
				uint64_t cache_expiration = 1800;
				bool logging = true;
			} explorer;
			struct
			{
				bool logging = true;
			} settlement;
			struct
			{
				uint64_t tls_trusted_peers = 100;
			} tcp;
			struct
			{
				string path;
				storage_optimization optimization = storage_optimization::safety;
				uint64_t index_page_size = 65536;
				int64_t index_cache_size = -2000;
				bool logging = false;
			} storage;
			struct
			{
				string info_path;
				string error_path;
				string query_path;
				uint64_t archive_size = 8 * 1024 * 1024;
				uint64_t archive_repack_interval = 1800;
				bool control_logging = false;
			} logs;
			unordered_map<string, chain_config> chains;
			unordered_map<string, unordered_map<string, token_config>> tokens;
			network_type network = network_type::mainnet;
		} user;

	private:
		struct
		{
			logger info;
			logger error;
			logger query;
		} logs;
		string path;

	public:
		repository database;

	public:
		protocol(const inline_args& environment);
		protocol(const protocol&) = delete;
		protocol(protocol&&) = delete;
		virtual ~protocol();
		protocol& operator=(const protocol&) = delete;
		protocol& operator=(protocol&&) = delete;
		chain_config& chain(const std::string_view& id);
		const chain_config* find_chain(const std::string_view& id) const;
		const token_config* find_token(const std::string_view& chain_id, const std::string_view& currency) const;
		void apply_environment(const std::string_view& id);
		bool is(network_type type) const;
		bool custom() const;

	private:
		void load_config(schema* config);
		void open_logs();
	};
}
#endif
