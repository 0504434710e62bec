#include "custody/entrypoints.hpp"
#include <thread>

using namespace custody;

class tests
{
public:
	class fake_channel final : public warden::http_channel
	{
	public:
		typedef std::function<warden::http_reply(const warden::http_request&)> route_callback;

	public:
		vector<warden::http_request> requests;
		route_callback route;

	public:
		expects_promise_system<warden::http_reply> fetch(warden::http_request&& request) override
		{
			requests.push_back(std::move(request));
			if (!route)
				return expects_promise_system<warden::http_reply>(system_exception("fake fetch: no route", std::make_error_condition(std::errc::host_unreachable)));

			return expects_promise_system<warden::http_reply>(expects_system<warden::http_reply>(route(requests.back())));
		}
		size_t count(const std::string_view& method)
		{
			size_t result = 0;
			for (auto& request : requests)
			{
				if (method_of(request) == method)
					++result;
			}
			return result;
		}
		uptr<schema> last_params(const std::string_view& method)
		{
			for (auto it = requests.rbegin(); it != requests.rend(); ++it)
			{
				if (method_of(*it) != method)
					continue;

				auto data = schema::from_json(it->body);
				if (!data)
					break;

				uptr<schema> body = *data;
				auto* params = body->get("params");
				return params ? params->copy() : var::set::array();
			}
			return var::set::array();
		}

	public:
		static string method_of(const warden::http_request& request)
		{
			if (request.body.empty())
				return string();

			auto data = schema::from_json(request.body);
			if (!data)
				return string();

			uptr<schema> body = *data;
			return body->get_var("method").get_blob();
		}
		static warden::http_reply reply(int32_t status, const std::string_view& content, const std::string_view& type = "application/json")
		{
			warden::http_reply result;
			result.status_code = status;
			result.content_type = type;
			result.content = content;
			return result;
		}
		static warden::http_reply rpc_error(int32_t code, const std::string_view& message)
		{
			return reply(500, stringify::text("{\"result\":null,\"error\":{\"code\":%i,\"message\":\"%.*s\"},\"id\":\"custody\"}", code, (int)message.size(), message.data()));
		}
		static warden::http_reply rpc_result(const std::string_view& result)
		{
			return reply(200, stringify::text("{\"result\":%.*s,\"error\":null,\"id\":\"custody\"}", (int)result.size(), result.data()));
		}
	};

	class scripted_fetcher final : public warden::transaction_fetcher
	{
	public:
		const chain_descriptor& chain;
		vector<vector<warden::observed_transaction>> script;
		vector<expects_promise_rt<vector<warden::observed_transaction>>> deferred;
		warden::fetch_policy last_policy = warden::fetch_policy::cached;
		size_t cursor = 0;
		size_t calls = 0;
		bool failing = false;
		bool throttled = false;
		bool deferring = false;

	public:
		scripted_fetcher(const chain_descriptor& new_chain) : chain(new_chain)
		{
		}
		expects_promise_rt<vector<warden::observed_transaction>> fetch(const std::string_view& address, warden::fetch_policy policy) override
		{
			++calls;
			last_policy = policy;
			if (deferring)
			{
				expects_promise_rt<vector<warden::observed_transaction>> future;
				deferred.push_back(future);
				return future;
			}
			else if (throttled)
				return expects_promise_rt<vector<warden::observed_transaction>>(remote_exception::retry());
			else if (failing)
				return expects_promise_rt<vector<warden::observed_transaction>>(remote_exception::transient("explorer is unreachable"));
			else if (script.empty())
				return expects_promise_rt<vector<warden::observed_transaction>>(expects_rt<vector<warden::observed_transaction>>(vector<warden::observed_transaction>()));

			auto& batch = script[std::min(cursor++, script.size() - 1)];
			return expects_promise_rt<vector<warden::observed_transaction>>(expects_rt<vector<warden::observed_transaction>>(batch));
		}
		expects_promise_rt<warden::transaction_detail> get_detail(const warden::observed_transaction& item) override
		{
			return expects_promise_rt<warden::transaction_detail>(expects_rt<warden::transaction_detail>(warden::transaction_detail::from_observation(item)));
		}
		const chain_descriptor& get_chain() const override
		{
			return chain;
		}
	};

	class flaky_ledger final : public ledger::ledger_gateway
	{
	public:
		ledger::ledger_gateway& base;
		size_t failures = 0;
		size_t attempts = 0;

	public:
		flaky_ledger(ledger::ledger_gateway& new_base) : base(new_base)
		{
		}
		expects_lr<option<ledger::persisted_transaction>> find_transaction(const std::string_view& hash, const std::string_view& wallet_id) override
		{
			return base.find_transaction(hash, wallet_id);
		}
		expects_lr<ledger::persisted_transaction> get_transaction(const std::string_view& id) override
		{
			return base.get_transaction(id);
		}
		expects_lr<bool> create_transaction(const ledger::persisted_transaction& record) override
		{
			return base.create_transaction(record);
		}
		expects_lr<bool> credit_deposit(const ledger::persisted_transaction& record) override
		{
			++attempts;
			if (failures > 0)
			{
				--failures;
				return layer_exception("database is locked");
			}
			return base.credit_deposit(record);
		}
		expects_lr<ledger::wallet_balance> debit(const std::string_view& wallet_id, const decimal& total, const ledger::persisted_transaction* record) override
		{
			return base.debit(wallet_id, total, record);
		}
		expects_lr<ledger::wallet_balance> transfer(const ledger::persisted_transaction& outgoing, const ledger::persisted_transaction& incoming) override
		{
			return base.transfer(outgoing, incoming);
		}
		expects_lr<void> update_transaction(const ledger::persisted_transaction& record) override
		{
			return base.update_transaction(record);
		}
		expects_lr<ledger::wallet_balance> refund(const std::string_view& transaction_id) override
		{
			return base.refund(transaction_id);
		}
		expects_lr<ledger::wallet_balance> get_wallet(const std::string_view& wallet_id) override
		{
			return base.get_wallet(wallet_id);
		}
		expects_lr<option<ledger::wallet_balance>> find_wallet(const std::string_view& user_id, const std::string_view& currency) override
		{
			return base.find_wallet(user_id, currency);
		}
		expects_lr<option<ledger::watched_address>> find_address(const std::string_view& chain, const std::string_view& address) override
		{
			return base.find_address(chain, address);
		}
		expects_lr<vector<ledger::watched_address>> get_addresses() override
		{
			return base.get_addresses();
		}
	};

	class recorded_dispatcher final : public settlement::withdrawal_dispatcher
	{
	public:
		vector<string> broadcasted;
		bool failing = false;

	public:
		expects_promise_rt<string> broadcast(const ledger::persisted_transaction& record) override
		{
			if (failing)
				return expects_promise_rt<string>(remote_exception::transient("node is unreachable"));

			string hash = "tx-" + record.id;
			broadcasted.push_back(hash);
			return expects_promise_rt<string>(expects_rt<string>(hash));
		}
	};

	struct event_counter
	{
		unordered_map<string, size_t> topics;
		vector<uint64_t> pending_confirmations;
		uptr<schema> last_stopped;

		size_t get(const std::string_view& topic)
		{
			auto it = topics.find(string(topic));
			return it != topics.end() ? it->second : 0;
		}
		void attach(events::event_broadcaster& broadcaster)
		{
			broadcaster.subscribe(events::topics::any(), "counter", [this](const std::string_view& topic, uptr<schema>&& payload) -> expects_lr<void>
			{
				++topics[string(topic)];
				if (topic == events::topics::deposit_pending())
					pending_confirmations.push_back((uint64_t)payload->get_var("confirmations").get_integer());
				else if (topic == events::topics::monitor_stopped())
					last_stopped = std::move(payload);
				return expectation::met;
			});
		}
	};

public:
	static decimal number(const std::string_view& value)
	{
		return decimal(value);
	}
	static chain_descriptor utxo_descriptor(const std::string_view& wallet = "ecosystem_wallets")
	{
		chain_descriptor result;
		result.id = "BTC";
		result.name = "Bitcoin";
		result.currency = "BTC";
		result.family = chain_family::utxo;
		result.decimals = 8;
		result.required_confirmations = 3;
		result.transport.policy = transport_policy::node_rpc;
		result.transport.node_url = "http://127.0.0.1:8332";
		result.transport.node_wallet = wallet;
		return result;
	}
	static chain_descriptor evm_descriptor()
	{
		chain_descriptor result;
		result.id = "ETH";
		result.name = "Ethereum";
		result.currency = "ETH";
		result.family = chain_family::account;
		result.backend = chain_backend::etherscan;
		result.decimals = 18;
		result.required_confirmations = 12;
		result.transport.policy = transport_policy::explorer_api;
		result.transport.networks["mainnet"] = { "api.etherscan.io", 1 };
		result.transport.network = "mainnet";
		result.transport.api_key = "testkey";
		return result;
	}
	static chain_descriptor tron_descriptor()
	{
		chain_descriptor result;
		result.id = "TRON";
		result.name = "Tron";
		result.currency = "TRX";
		result.family = chain_family::explorer_only;
		result.backend = chain_backend::trongrid;
		result.decimals = 6;
		result.required_confirmations = 1;
		result.fees.activation = decimal(1);
		result.fees.requires_activation = true;
		result.fees.dynamic_estimation = true;
		result.transport.policy = transport_policy::third_party_service;
		result.transport.networks["mainnet"] = { "api.trongrid.io", 0 };
		result.transport.network = "mainnet";
		result.transport.explorer_api = false;
		return result;
	}
	static chain_registry evm_registry(const decimal& percentage, const decimal& minimum, int16_t precision = -1)
	{
		token_descriptor token;
		token.chain = "ETH";
		token.currency = "ETH";
		token.fees.percentage = percentage;
		token.fees.minimum = minimum;
		token.decimals = (uint8_t)18;
		if (precision >= 0)
			token.precision = (uint8_t)precision;

		vector<chain_descriptor> chains;
		chains.push_back(evm_descriptor());
		chains.push_back(utxo_descriptor());
		vector<token_descriptor> tokens;
		tokens.push_back(std::move(token));
		return chain_registry(std::move(chains), std::move(tokens));
	}
	static warden::observed_transaction observation(const std::string_view& hash, const std::string_view& address, const decimal& value, uint64_t confirmations)
	{
		warden::observed_transaction item;
		item.hash = hash;
		item.chain = "BTC";
		item.address = address;
		item.from = "bc1qsender";
		item.to = address;
		item.value = value;
		item.raw_value = value.to_string();
		item.confirmations = confirmations;
		item.direction = warden::transfer_direction::incoming;
		item.block_time = 1700000000;
		return item;
	}
	static void use_clean_state(protocol& params)
	{
		string path = params.database.resolve(params.user.network, params.user.storage.path);
		params.database.reset();
		os::directory::remove(path);
	}
	static void use_monitor_options(protocol& params)
	{
		auto& monitor = params.user.monitor;
		monitor.polling_interval = 1000;
		monitor.max_backoff = 5000;
		monitor.max_consecutive_errors = 5;
		monitor.required_confirmations = 3;
		monitor.logging = false;
		params.user.relay.timeout = 3000;
		params.user.relay.retry_timeout = 300;
		params.user.relay.max_retries = 5;
		params.user.relay.logging = false;
		params.user.settlement.logging = false;
	}
	static ledger::watched_address watched(const ledger::wallet_balance& wallet, const std::string_view& chain, const std::string_view& address)
	{
		ledger::watched_address result;
		result.wallet_id = wallet.id;
		result.chain = chain;
		result.address = address;
		return result;
	}

public:
	static void registry_default_chains()
	{
		auto registry = chain_registry(chain_registry::default_chains());
		auto bitcoin = registry.get_chain("btc");
		VI_PANIC(bitcoin && (*bitcoin)->family == chain_family::utxo && (*bitcoin)->required_confirmations == 3, "bitcoin descriptor is missing");
		VI_PANIC((*bitcoin)->transport.policy == transport_policy::node_rpc && (*bitcoin)->decimals == 8, "bitcoin transport is wrong");

		auto tron = registry.get_chain("TRON");
		VI_PANIC(tron && (*tron)->decimals == 6 && (*tron)->fees.requires_activation && (*tron)->fees.activation == decimal(1), "tron descriptor is wrong");

		auto monero = registry.get_chain("XMR");
		VI_PANIC(monero && (*monero)->decimals == 12 && (*monero)->fees.dynamic_estimation, "monero descriptor is wrong");

		auto ethereum = registry.get_chain("ETH");
		VI_PANIC(ethereum && (*ethereum)->is_evm() && (*ethereum)->transport.networks.size() == 2, "ethereum descriptor is wrong");
		VI_PANIC((*bitcoin)->backend == chain_backend::bitcoin_node && (*tron)->backend == chain_backend::trongrid && (*monero)->backend == chain_backend::monero_wallet, "chain backends are wrong");
		VI_PANIC(!(*tron)->is_evm() && (*registry.get_chain("polygon"))->backend == chain_backend::etherscan, "explorer chains must use the etherscan backend");

		auto unknown = registry.get_chain("SOL");
		VI_PANIC(!unknown && stringify::starts_with(unknown.what(), "unsupported chain"), "unknown chain must be unsupported");

		auto native = registry.get_token("eth", "eth");
		VI_PANIC(native && (*native)->withdrawal_precision() == 18, "native token precision must follow decimals");

		auto missing = registry.get_token("ETH", "USDT");
		VI_PANIC(!missing && stringify::starts_with(missing.what(), "token not found"), "unknown token must be rejected");
		VI_PANIC(registry.get_chains(chain_family::utxo).size() == 4, "utxo chain table is wrong");
		VI_PANIC((*bitcoin)->to_minor(number("0.5")) == decimal(50000000), "minor unit conversion is wrong");
	}
	static void events_subscriber_isolation()
	{
		events::event_broadcaster broadcaster;
		size_t failing_calls = 0;
		string received;
		broadcaster.subscribe(events::topics::deposit_confirmed(), "failing", [&](const std::string_view&, uptr<schema>&& payload) -> expects_lr<void>
		{
			++failing_calls;
			payload->set("amount", var::string("999"));
			return layer_exception("subscriber is offline");
		});
		uint64_t healthy = broadcaster.subscribe(events::topics::any(), "healthy", [&](const std::string_view& topic, uptr<schema>&& payload) -> expects_lr<void>
		{
			received = string(topic) + ":" + payload->get_var("amount").get_blob();
			return expectation::met;
		});

		uptr<schema> payload = var::set::object();
		payload->set("amount", var::string("0.5"));
		size_t delivered = broadcaster.publish(events::topics::deposit_confirmed(), *payload);
		VI_PANIC(delivered == 1 && failing_calls == 1, "failing subscriber must not block delivery");
		VI_PANIC(received == "deposit.confirmed:0.5", "subscribers must receive private copies");
		VI_PANIC(payload->get_var("amount").get_blob() == "0.5" && broadcaster.get_failures() == 1 && broadcaster.get_published() == 1, "publisher payload must stay intact");

		delivered = broadcaster.publish(events::topics::withdrawal_pending(), *payload);
		VI_PANIC(delivered == 1 && failing_calls == 1, "topic filter is broken");
		VI_PANIC(broadcaster.unsubscribe(healthy) && !broadcaster.unsubscribe(healthy) && broadcaster.size() == 1, "unsubscribe is broken");
	}
	static void ledger_idempotent_credit(protocol& params)
	{
		use_clean_state(params);
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");

		ledger::persisted_transaction record;
		record.id = ledger::ledger_util::generate_id();
		record.hash = "a1b2c3";
		record.wallet_id = wallet.id;
		record.chain = "BTC";
		record.currency = "BTC";
		record.address = "bc1qtarget";
		record.type = ledger::transaction_type::deposit;
		record.status = ledger::transaction_status::confirmed;
		record.amount = number("0.75");
		record.created_at = ledger::ledger_util::timestamp();

		auto first = ledger.credit_deposit(record);
		VI_PANIC(first && *first, "first credit must be applied");

		ledger::persisted_transaction replay = record;
		replay.id = ledger::ledger_util::generate_id();
		auto second = ledger.credit_deposit(replay);
		VI_PANIC(second && !*second, "repeated credit must be a no-op");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		VI_PANIC(balance.balance == number("0.75"), "balance must be credited exactly once");

		auto existing = ledger.find_transaction("a1b2c3", wallet.id);
		VI_PANIC(existing && *existing && (**existing).status == ledger::transaction_status::confirmed, "deposit record must be stored");

		auto overdraft = ledger.debit(wallet.id, decimal(1), nullptr);
		VI_PANIC(!overdraft && stringify::starts_with(overdraft.what(), "insufficient funds"), "overdraft must be rejected");

		auto missing = ledger.get_wallet("missing");
		VI_PANIC(!missing && stringify::starts_with(missing.what(), "wallet not found"), "unknown wallet must be rejected");
	}
	static void relay_retry_backoff(protocol& params)
	{
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		channel.route = [](const warden::http_request&) { return fake_channel::reply(503, "unavailable", "text/plain"); };

		warden::server_relay relay = warden::server_relay(params, &channel, &timers, "http://127.0.0.1:8332");
		warden::server_relay::error_reporter reporter;
		auto future = relay.execute_rpc(reporter, "getblockchaininfo", { });
		while (future.is_pending() && timers.step());

		VI_PANIC(!future.is_pending(), "relay must give up after cooldowns");
		auto result = future.get();
		VI_PANIC(!result && channel.requests.size() == 5, "relay must retry before giving up");
		VI_PANIC(stringify::find(result.what(), "warden::jrpc::getblockchaininfo error").found, "relay error must name the method");

		vector<uint64_t> expected_delays = { 300, 600, 1200, 2400 };
		VI_PANIC(timers.get_delays() == expected_delays, "cooldown must double between attempts");

		size_t attempts = 0;
		channel.requests.clear();
		channel.route = [&attempts](const warden::http_request&)
		{
			if (++attempts < 3)
				return fake_channel::reply(502, "bad gateway", "text/plain");

			return fake_channel::rpc_result("{\"blocks\":10,\"headers\":11}");
		};

		warden::server_relay::error_reporter recovery;
		auto retried = relay.execute_rpc(recovery, "getblockchaininfo", { });
		while (retried.is_pending() && timers.step());

		auto recovered = retried.get();
		VI_PANIC(recovered && attempts == 3, "relay must recover after transient failures");
		uptr<schema> data = *recovered;
		VI_PANIC(data->get_var("blocks").get_integer() == 10, "relay must unwrap the rpc result");
	}
	static void node_wallet_recovery(protocol& params)
	{
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		size_t imports = 0;
		channel.route = [&imports](const warden::http_request& request)
		{
			string method = fake_channel::method_of(request);
			if (method == "loadwallet")
				return fake_channel::rpc_error(-35, "Wallet \\\"ecosystem_wallets\\\" is already loaded.");
			else if (method == "importaddress")
				return ++imports == 1 ? fake_channel::rpc_error(-18, "Requested wallet does not exist or is not loaded") : fake_channel::rpc_error(-4, "Already have this key");
			else if (method == "getblockchaininfo")
				return fake_channel::rpc_result("{\"chain\":\"main\",\"blocks\":99,\"headers\":100,\"verificationprogress\":0.99}");
			return fake_channel::rpc_error(-32601, "Method not found");
		};

		auto chain = utxo_descriptor();
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, chain.transport.node_url);
		warden::node_client node = warden::node_client(relay, chain);
		auto ready = node.ensure_wallet().get();
		VI_PANIC(ready && node.is_wallet_ready(), "already loaded wallet must be accepted");

		auto imported = node.import_watch_address("bc1qtarget", "custody:wallet", false).get();
		VI_PANIC(imported, "already imported address must be accepted");
		VI_PANIC(channel.count("loadwallet") == 2 && channel.count("importaddress") == 2, "unloaded wallet must be reloaded once");

		auto args = channel.last_params("importaddress");
		VI_PANIC(args->size() == 3 && args->get_var(0).get_blob() == "bc1qtarget" && !args->get_var(2).get_boolean(), "import must not rescan by default");
		VI_PANIC(stringify::ends_with(channel.requests.back().url, "/wallet/ecosystem_wallets"), "wallet calls must be wallet-scoped");

		auto synced = node.is_synced().get();
		VI_PANIC(synced && *synced, "node one block behind headers must count as synced");

		fake_channel fresh_channel;
		fresh_channel.route = [](const warden::http_request& request)
		{
			string method = fake_channel::method_of(request);
			if (method == "loadwallet")
				return fake_channel::rpc_error(-18, "Wallet file not found.");
			else if (method == "createwallet")
				return fake_channel::rpc_result("{\"name\":\"fresh_wallets\",\"warning\":\"\"}");
			return fake_channel::rpc_error(-32601, "Method not found");
		};

		auto fresh_chain = utxo_descriptor("fresh_wallets");
		warden::server_relay fresh_relay = warden::server_relay(params, &fresh_channel, &timers, fresh_chain.transport.node_url);
		warden::node_client fresh_node = warden::node_client(fresh_relay, fresh_chain);
		auto created = fresh_node.ensure_wallet().get();
		VI_PANIC(created && fresh_channel.count("createwallet") == 1, "missing wallet must be created");

		auto create_args = fresh_channel.last_params("createwallet");
		VI_PANIC(create_args->size() == 7 && create_args->get_var(0).get_blob() == "fresh_wallets" && create_args->get_var(1).get_boolean(), "wallet must be created without private keys");
		VI_PANIC(!create_args->get_var(5).get_boolean(), "watch-only wallet must be a legacy wallet to accept importaddress");
	}
	static void utxo_receive_aggregation(protocol& params)
	{
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		channel.route = [](const warden::http_request& request)
		{
			string method = fake_channel::method_of(request);
			if (method == "loadwallet")
				return fake_channel::rpc_result("{\"name\":\"ecosystem_wallets\",\"warning\":\"\"}");
			else if (method != "listtransactions")
				return fake_channel::rpc_error(-32601, "Method not found");

			return fake_channel::rpc_result(
				"["
				"{\"address\":\"bc1qtarget\",\"category\":\"receive\",\"amount\":0.25,\"vout\":0,\"confirmations\":2,\"txid\":\"aa\",\"time\":1700000000},"
				"{\"address\":\"bc1qtarget\",\"category\":\"receive\",\"amount\":0.5,\"vout\":1,\"confirmations\":2,\"txid\":\"aa\",\"time\":1700000000},"
				"{\"address\":\"bc1qother\",\"category\":\"receive\",\"amount\":1,\"vout\":0,\"confirmations\":5,\"txid\":\"bb\",\"time\":1700000100},"
				"{\"address\":\"bc1qtarget\",\"category\":\"send\",\"amount\":-0.1,\"vout\":0,\"confirmations\":7,\"txid\":\"cc\",\"time\":1700000200}"
				"]");
		};

		auto chain = utxo_descriptor();
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, chain.transport.node_url);
		warden::node_client node = warden::node_client(relay, chain);
		warden::backends::utxo_fetcher fetcher = warden::backends::utxo_fetcher(node, 100);
		auto transactions = fetcher.fetch("bc1qtarget", warden::fetch_policy::fresh).get();
		VI_PANIC(transactions && transactions->size() == 1, "only receive entries of the address must be kept");

		auto& item = transactions->front();
		VI_PANIC(item.hash == "aa" && item.value == number("0.75") && item.confirmations == 2, "outputs of one transaction must be aggregated");
		VI_PANIC(item.direction == warden::transfer_direction::incoming && item.block_time == 1700000000, "observation fields are wrong");

		auto args = channel.last_params("listtransactions");
		VI_PANIC(args->size() == 4 && args->get_var(0).get_blob() == "*" && args->get_var(1).get_integer() == 100 && args->get_var(3).get_boolean(), "listtransactions must include watch-only entries");
	}
	static void explorer_responses(protocol& params)
	{
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		auto chain = evm_descriptor();
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, std::string_view());
		warden::backends::explorer_fetcher fetcher = warden::backends::explorer_fetcher(relay, nullptr, chain, 1800, false);

		auto url = warden::backends::explorer_fetcher::get_url(chain, "0xAbC0000000000000000000000000000000000001");
		VI_PANIC(url && *url == "https://api.etherscan.io/v2/api?module=account&action=txlist&address=0xAbC0000000000000000000000000000000000001&startblock=0&endblock=99999999&sort=desc&chainid=1&apikey=testkey", "explorer url is wrong");

		auto unnamed = evm_descriptor();
		unnamed.transport.network.clear();
		auto no_network = warden::backends::explorer_fetcher::get_url(unnamed, "0x01");
		VI_PANIC(!no_network && no_network.what() == "environment variable ETH_NETWORK is not set", "missing network must be reported");

		auto keyless = evm_descriptor();
		keyless.transport.api_key.clear();
		auto no_key = warden::backends::explorer_fetcher::get_url(keyless, "0x01");
		VI_PANIC(!no_key && no_key.what() == "environment variable ETH_EXPLORER_API_KEY is not set", "missing api key must be reported");

		auto misconfigured = evm_descriptor();
		misconfigured.transport.network = "ropsten";
		auto no_endpoint = warden::backends::explorer_fetcher::get_url(misconfigured, "0x01");
		VI_PANIC(!no_endpoint && stringify::starts_with(no_endpoint.what(), "unsupported or misconfigured network"), "unknown network must be reported");

		channel.route = [](const warden::http_request&) { return fake_channel::reply(200, "{\"status\":\"0\",\"message\":\"NOTOK\",\"result\":\"Max rate limit reached\"}"); };
		auto notok = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(notok && notok->empty(), "NOTOK must produce an empty list");

		channel.route = [](const warden::http_request&) { return fake_channel::reply(200, "{\"status\":\"0\",\"message\":\"No transactions found\",\"result\":[]}"); };
		auto empty = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(empty && empty->empty(), "empty history must produce an empty list");

		channel.route = [](const warden::http_request&) { return fake_channel::reply(200, "{\"status\":\"1\",\"message\":\"OK\",\"result\":{\"unexpected\":true}}"); };
		auto invalid = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(!invalid && stringify::find(invalid.what(), "expected {result: array}").found, "invalid shape must be an error");

		channel.route = [](const warden::http_request&)
		{
			return fake_channel::reply(200,
				"{\"status\":\"1\",\"message\":\"OK\",\"result\":["
				"{\"hash\":\"0x01\",\"from\":\"0xsender\",\"to\":\"0xABC0000000000000000000000000000000000001\",\"value\":\"1500000000000000000\",\"confirmations\":\"14\",\"timeStamp\":\"1700000000\",\"isError\":\"0\"},"
				"{\"hash\":\"0x02\",\"from\":\"0xabc0000000000000000000000000000000000001\",\"to\":\"0xreceiver\",\"value\":\"100\",\"confirmations\":\"20\",\"timeStamp\":\"1700000100\",\"isError\":\"0\"},"
				"{\"hash\":\"0x03\",\"from\":\"0xsender\",\"to\":\"0xabc0000000000000000000000000000000000001\",\"value\":\"100\",\"confirmations\":\"20\",\"timeStamp\":\"1700000200\",\"isError\":\"1\"}"
				"]}");
		};
		auto listed = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(listed && listed->size() == 2, "failed transactions must be skipped");
		VI_PANIC(listed->at(0).direction == warden::transfer_direction::incoming && listed->at(0).value == number("1.5") && listed->at(0).confirmations == 14, "incoming transfer must be normalized");
		VI_PANIC(listed->at(1).direction == warden::transfer_direction::outgoing, "outgoing transfer must be detected");
	}
	static void explorer_cached_history(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		uint64_t confirmations = 3;
		channel.route = [&confirmations](const warden::http_request&)
		{
			return fake_channel::reply(200, stringify::text(
				"{\"status\":\"1\",\"message\":\"OK\",\"result\":["
				"{\"hash\":\"0x0a\",\"from\":\"0xsender\",\"to\":\"0xabc0000000000000000000000000000000000001\",\"value\":\"250000000000000000\",\"confirmations\":\"%i\",\"timeStamp\":\"1700000000\",\"isError\":\"0\"}"
				"]}", (int)confirmations));
		};

		auto chain = evm_descriptor();
		chain.transport.cache = true;
		storages::cachestate cache = storages::cachestate(params.database);
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, std::string_view());
		warden::backends::explorer_fetcher fetcher = warden::backends::explorer_fetcher(relay, &cache, chain, 1800, false);
		auto first = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(first && first->size() == 1 && channel.requests.size() == 1, "first lookup must reach the explorer");

		auto second = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(second && second->size() == 1 && channel.requests.size() == 1, "second lookup must be served from cache");
		VI_PANIC(second->front().hash == "0x0a" && second->front().value == number("0.25") && second->front().direction == warden::transfer_direction::incoming, "cached observation must be restored intact");

		confirmations = 15;
		auto fresh = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::fresh).get();
		VI_PANIC(fresh && fresh->size() == 1 && fresh->front().confirmations == 15 && channel.requests.size() == 2, "fresh lookup must bypass the cache");

		auto refreshed = fetcher.fetch("0xabc0000000000000000000000000000000000001", warden::fetch_policy::cached).get();
		VI_PANIC(refreshed && refreshed->front().confirmations == 15 && channel.requests.size() == 2, "fresh lookup must refresh the cache");

		auto pruned = cache.prune_cache();
		VI_PANIC(pruned && *pruned == 0, "fresh entries must survive pruning");

		auto missing = cache.get_cache(warden::backends::explorer_fetcher::get_cache_key(chain, "0xdef"));
		VI_PANIC(!missing, "unknown key must miss");
	}
	static void monitor_confirmation_progress(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);

		auto chain = utxo_descriptor();
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");
		scripted_fetcher fetcher = scripted_fetcher(chain);
		for (uint64_t confirmations : { 0, 0, 1, 1, 2, 3 })
			fetcher.script.push_back({ observation("f00d", "bc1qtarget", number("0.5"), confirmations) });

		deposits::deposit_monitor monitor = deposits::deposit_monitor(params, chain, watched(wallet, "BTC", "bc1qtarget"), fetcher, ledger, broadcaster, timers);
		VI_PANIC(monitor.start() && !monitor.start(), "monitor must start once");
		VI_PANIC(timers.run(6) == 6 && fetcher.calls == 6, "each timer step must run one polling cycle");

		vector<uint64_t> expected_pending = { 0, 1, 2 };
		VI_PANIC(counter.pending_confirmations == expected_pending, "pending events must fire only on confirmation changes");
		VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1, "deposit must be confirmed once");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		VI_PANIC(balance.balance == number("0.5"), "confirmed deposit must be credited");

		VI_PANIC(timers.run(2) == 2, "monitor must keep polling");
		VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1 && counter.get(events::topics::deposit_pending()) == 3, "processed transaction must not emit again");

		auto state = monitor.state();
		VI_PANIC(state.active && state.processed == 1 && state.consecutive_errors == 0 && state.next_delay == 1000, "monitor state is wrong");
		VI_PANIC(monitor.stop() && !monitor.stop() && timers.pending() == 0, "stop must be idempotent and cancel the timer");
	}
	static void monitor_restart_idempotency(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);

		auto chain = utxo_descriptor();
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");
		scripted_fetcher fetcher = scripted_fetcher(chain);
		fetcher.script.push_back({ observation("beef", "bc1qtarget", number("1.25"), 6) });
		{
			deposits::deposit_monitor first = deposits::deposit_monitor(params, chain, watched(wallet, "BTC", "bc1qtarget"), fetcher, ledger, broadcaster, timers);
			first.start();
			timers.step();
			VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1, "first monitor must credit the deposit");
		}

		deposits::deposit_monitor second = deposits::deposit_monitor(params, chain, watched(wallet, "BTC", "bc1qtarget"), fetcher, ledger, broadcaster, timers);
		second.start();
		timers.run(3);
		VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1, "restarted monitor must not credit again");
		VI_PANIC(second.state().processed == 1, "restarted monitor must learn processed hashes from the ledger");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		VI_PANIC(balance.balance == number("1.25"), "balance must reflect a single credit");

		auto records = ledger.get_transactions(wallet.id, ledger::transaction_status::confirmed).expect("transaction lookup failed");
		VI_PANIC(records.size() == 1 && records.front().hash == "beef" && records.front().type == ledger::transaction_type::deposit, "exactly one deposit record must exist");
	}
	static void monitor_fail_stop(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);

		auto chain = utxo_descriptor();
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");
		scripted_fetcher fetcher = scripted_fetcher(chain);
		fetcher.failing = true;

		deposits::deposit_monitor monitor = deposits::deposit_monitor(params, chain, watched(wallet, "BTC", "bc1qtarget"), fetcher, ledger, broadcaster, timers);
		monitor.start();
		VI_PANIC(timers.run(10) == 5, "monitor must stop after the error cap");

		vector<uint64_t> expected_delays = { 0, 1000, 2000, 4000, 5000 };
		VI_PANIC(timers.get_delays() == expected_delays, "backoff must double up to the cap");

		auto state = monitor.state();
		VI_PANIC(!state.active && state.stopped_by_failure && state.consecutive_errors == 5, "monitor must fail-stop");
		VI_PANIC(counter.get(events::topics::monitor_stopped()) == 1 && counter.last_stopped, "fail-stop must be reported");
		VI_PANIC(counter.last_stopped->get_var("consecutiveErrors").get_integer() == 5 && counter.last_stopped->get_var("address").get_blob() == "bc1qtarget", "fail-stop event is wrong");

		fetcher.failing = false;
		VI_PANIC(monitor.restart(), "stopped monitor must restart");
		VI_PANIC(timers.step() && monitor.state().active && monitor.state().consecutive_errors == 0 && !monitor.state().stopped_by_failure, "restart must reset the error counter");
	}
	static void supervisor_watch_lifecycle(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		channel.route = [](const warden::http_request& request)
		{
			string method = fake_channel::method_of(request);
			if (method == "loadwallet")
				return fake_channel::rpc_result("{\"name\":\"ecosystem_wallets\",\"warning\":\"\"}");
			else if (method == "importaddress")
				return fake_channel::rpc_result("{}");
			else if (method == "rescanblockchain")
				return fake_channel::rpc_result("{\"start_height\":100,\"stop_height\":200}");
			else if (method == "listtransactions")
				return fake_channel::rpc_result("[]");
			return fake_channel::rpc_error(-32601, "Method not found");
		};

		vector<chain_descriptor> chains;
		chains.push_back(utxo_descriptor());
		chains.push_back(evm_descriptor());
		auto registry = chain_registry(std::move(chains));
		auto* chain = *registry.get_chain("BTC");
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");
		events::event_broadcaster broadcaster;
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, chain->transport.node_url);
		warden::node_client node = warden::node_client(relay, *chain);
		warden::fetcher_set fetchers;
		fetchers.assign(*chain, uptr<warden::transaction_fetcher>(memory::init<warden::backends::utxo_fetcher>(node, 100)));

		deposits::monitor_supervisor supervisor = deposits::monitor_supervisor(params, registry, fetchers, ledger, broadcaster, timers);
		supervisor.assign_node("btc", &node);
		auto status = supervisor.watch(watched(wallet, "btc", "bc1qtarget")).get();
		VI_PANIC(status && supervisor.size() == 1 && channel.count("importaddress") == 1, "watch must import the address and start a monitor");

		auto args = channel.last_params("importaddress");
		VI_PANIC(args->get_var(0).get_blob() == "bc1qtarget" && !args->get_var(2).get_boolean(), "watch must import without rescan");

		status = supervisor.watch(watched(wallet, "BTC", "bc1qtarget")).get();
		VI_PANIC(status && supervisor.size() == 1 && channel.count("importaddress") == 1, "repeated watch must be a no-op");

		auto unsupported = supervisor.watch(watched(wallet, "SOL", "sol-address")).get();
		VI_PANIC(!unsupported && stringify::starts_with(unsupported.what(), "unsupported chain"), "unknown chain must be rejected");

		auto* monitor = supervisor.get_monitor("BTC", "bc1qtarget");
		VI_PANIC(monitor != nullptr && monitor->state().active, "monitor must be active");
		VI_PANIC(timers.step() && channel.count("listtransactions") == 1, "monitor must poll through the node");

		monitor->stop();
		auto stopped = supervisor.get_stopped();
		VI_PANIC(stopped.size() == 1 && stopped.front() == "BTC:bc1qtarget", "stopped monitors must be listed");
		VI_PANIC(supervisor.restart("BTC", "bc1qtarget") && supervisor.get_stopped().empty(), "restart must revive the monitor");
		VI_PANIC(!supervisor.restart("BTC", "bc1qmissing"), "unknown monitor must not restart");

		auto rescanned = supervisor.rescan("BTC", 100).get();
		VI_PANIC(rescanned && channel.last_params("rescanblockchain")->get_var(0).get_integer() == 100, "rescan must start from the requested height");

		auto no_node = supervisor.rescan("ETH", 0).get();
		VI_PANIC(!no_node, "rescan needs a node");
		VI_PANIC(supervisor.unwatch("BTC", "bc1qtarget") && supervisor.size() == 0 && !supervisor.unwatch("BTC", "bc1qtarget"), "unwatch must remove the monitor");
	}
	static void node_transaction_queries(protocol& params)
	{
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		channel.route = [](const warden::http_request& request)
		{
			string method = fake_channel::method_of(request);
			if (method == "loadwallet")
				return fake_channel::rpc_result("{\"name\":\"ecosystem_wallets\",\"warning\":\"\"}");
			else if (method == "getblockchaininfo")
				return fake_channel::rpc_result("{\"chain\":\"main\",\"blocks\":50,\"headers\":200,\"verificationprogress\":0.25}");
			else if (method == "getrawtransaction")
				return fake_channel::rpc_error(-5, "No such mempool or blockchain transaction. Use gettransaction for wallet transactions.");
			else if (method == "gettransaction")
			{
				return fake_channel::rpc_result(
					"{\"txid\":\"dd\",\"confirmations\":4,\"blocktime\":1700000300,\"fee\":-0.0001,\"decoded\":{"
					"\"vin\":[{\"txid\":\"p1\",\"vout\":0},{\"txid\":\"p2\",\"vout\":1,\"prevout\":{\"value\":0.2,\"scriptPubKey\":{\"address\":\"bc1qprevious\"}}}],"
					"\"vout\":[{\"value\":0.4,\"n\":0,\"scriptPubKey\":{\"address\":\"bc1qtarget\"}},{\"value\":0.1,\"n\":1,\"scriptPubKey\":{\"address\":\"bc1qchange\"}}]"
					"}}");
			}
			else if (method == "listunspent")
			{
				return fake_channel::rpc_result(
					"["
					"{\"txid\":\"u1\",\"address\":\"bc1qtarget\",\"amount\":0.3,\"vout\":0,\"confirmations\":5},"
					"{\"txid\":\"u2\",\"address\":\"bc1qtarget\",\"amount\":0.2,\"vout\":1,\"confirmations\":1}"
					"]");
			}
			return fake_channel::rpc_error(-32601, "Method not found");
		};

		auto chain = utxo_descriptor();
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, chain.transport.node_url);
		warden::node_client node = warden::node_client(relay, chain);
		auto detail = node.get_transaction("dd").get();
		VI_PANIC(detail && detail->confirmations == 4 && detail->fee == number("0.0001"), "detail must survive parents outside of the wallet");
		VI_PANIC(detail->inputs.size() == 2 && detail->inputs[0].address.empty() && detail->inputs[0].value.is_zero(), "unresolvable input must stay anonymous");
		VI_PANIC(detail->senders().size() == 1 && detail->senders().front() == "bc1qprevious", "prevout input must keep its address");
		VI_PANIC(detail->paid_to("bc1qtarget") == number("0.4") && detail->outputs.size() == 2, "outputs must be kept");
		VI_PANIC(channel.count("getrawtransaction") == 1, "only inputs without prevout need a lookup");

		auto outputs = node.list_unspent("bc1qtarget", 1).get();
		VI_PANIC(outputs && outputs->size() == 2 && outputs->front().hash == "u1" && outputs->front().confirmations == 5, "unspent outputs are wrong");

		auto args = channel.last_params("listunspent");
		VI_PANIC(args->size() == 4 && args->get_var(0).get_integer() == 1 && args->get_childs().at(2)->size() == 1, "listunspent must filter by address");

		auto balance = node.get_balance("bc1qtarget").get();
		VI_PANIC(balance && *balance == number("0.5"), "balance must sum unspent outputs");

		auto progress = node.get_sync_progress().get();
		VI_PANIC(progress && *progress == 25.0, "sync progress must compare blocks with headers");

		auto synced = node.is_synced().get();
		VI_PANIC(synced && !*synced, "node far behind headers must not count as synced");
	}
	static void monitor_persistence_retry(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);

		auto chain = utxo_descriptor();
		storages::ledgerstate storage = storages::ledgerstate(params.database);
		auto wallet = storage.create_wallet("user1", "BTC").expect("wallet creation failed");
		flaky_ledger ledger = flaky_ledger(storage);
		ledger.failures = 1;
		scripted_fetcher fetcher = scripted_fetcher(chain);
		fetcher.script.push_back({ observation("abba", "bc1qtarget", number("0.2"), 4) });

		deposits::deposit_monitor monitor = deposits::deposit_monitor(params, chain, watched(wallet, "BTC", "bc1qtarget"), fetcher, ledger, broadcaster, timers);
		monitor.start();
		VI_PANIC(timers.step() && ledger.attempts == 1, "confirmed deposit must be persisted");
		VI_PANIC(monitor.state().processed == 0 && counter.get(events::topics::deposit_confirmed()) == 0, "failed persistence must leave the hash unprocessed");
		VI_PANIC(storage.get_wallet(wallet.id).expect("wallet lookup failed").balance.is_zero(), "failed persistence must not credit");

		VI_PANIC(timers.step() && ledger.attempts == 2, "next poll must retry persistence");
		VI_PANIC(monitor.state().processed == 1 && counter.get(events::topics::deposit_confirmed()) == 1, "retried deposit must be confirmed");
		VI_PANIC(storage.get_wallet(wallet.id).expect("wallet lookup failed").balance == number("0.2"), "retried deposit must be credited once");

		VI_PANIC(timers.step() && ledger.attempts == 2, "stored deposit must not be persisted again");
		VI_PANIC(fetcher.last_policy == warden::fetch_policy::fresh, "monitor must not poll through the cache");
	}
	static void monitor_malformed_response(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		fake_channel channel;
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);
		channel.route = [](const warden::http_request&) { return fake_channel::reply(200, "{\"status\":\"1\",\"message\":\"OK\",\"result\":{\"unexpected\":true}}"); };

		auto chain = evm_descriptor();
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "ETH").expect("wallet creation failed");
		warden::server_relay relay = warden::server_relay(params, &channel, &timers, std::string_view());
		warden::backends::explorer_fetcher fetcher = warden::backends::explorer_fetcher(relay, nullptr, chain, 1800, false);

		deposits::deposit_monitor monitor = deposits::deposit_monitor(params, chain, watched(wallet, "ETH", "0xabc0000000000000000000000000000000000001"), fetcher, ledger, broadcaster, timers);
		monitor.start();
		VI_PANIC(timers.step() && monitor.state().consecutive_errors == 1 && monitor.state().next_delay == 1000, "malformed response must count as a failed cycle");
		VI_PANIC(timers.run(10) == 4 && channel.requests.size() == 5, "malformed responses must fail-stop at the cap");

		auto state = monitor.state();
		VI_PANIC(!state.active && state.stopped_by_failure && state.consecutive_errors == 5, "monitor must fail-stop");
		VI_PANIC(counter.get(events::topics::monitor_stopped()) == 1 && stringify::find(counter.last_stopped->get_var("reason").get_blob(), "expected {result: array}").found, "fail-stop must carry the upstream error");

		auto bitcoin = utxo_descriptor();
		scripted_fetcher throttled = scripted_fetcher(bitcoin);
		throttled.throttled = true;
		deposits::deposit_monitor limited = deposits::deposit_monitor(params, bitcoin, watched(wallet, "BTC", "bc1qtarget"), throttled, ledger, broadcaster, timers);
		limited.start();
		VI_PANIC(timers.run(6) == 6 && throttled.calls == 6, "throttled monitor must keep polling");
		VI_PANIC(limited.state().active && limited.state().consecutive_errors == 0 && limited.state().next_delay == 1000, "throttling must not count as an error");
		limited.stop();
	}
	static void monitor_inflight_cycle(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		manual_scheduler timers;
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);

		vector<chain_descriptor> chains;
		chains.push_back(utxo_descriptor());
		auto registry = chain_registry(std::move(chains));
		auto* chain = *registry.get_chain("BTC");
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "BTC").expect("wallet creation failed");
		auto* fetcher = memory::init<scripted_fetcher>(*chain);
		fetcher->deferring = true;
		warden::fetcher_set fetchers;
		fetchers.assign(*chain, uptr<warden::transaction_fetcher>(fetcher));

		vector<warden::observed_transaction> batch = { observation("cafe", "bc1qtarget", number("0.3"), 6) };
		{
			deposits::monitor_supervisor supervisor = deposits::monitor_supervisor(params, registry, fetchers, ledger, broadcaster, timers);
			auto status = supervisor.watch(watched(wallet, "BTC", "bc1qtarget")).get();
			VI_PANIC(status && timers.step() && fetcher->deferred.size() == 1, "cycle must wait on the fetcher");

			auto* monitor = supervisor.get_monitor("BTC", "bc1qtarget");
			VI_PANIC(monitor != nullptr && monitor->state().polling, "monitor must report the cycle in flight");
			VI_PANIC(supervisor.restart("BTC", "bc1qtarget") && timers.pending() == 0, "restart must not overlap the cycle in flight");

			fetcher->deferred.front().set(expects_rt<vector<warden::observed_transaction>>(batch));
			VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 0, "superseded cycle must not credit");
			VI_PANIC(!monitor->state().polling && monitor->state().active && timers.pending() == 1, "restarted monitor must resume after the superseded cycle");

			fetcher->deferring = false;
			fetcher->script.push_back(batch);
			VI_PANIC(timers.step() && counter.get(events::topics::deposit_confirmed()) == 1 && fetcher->calls == 2, "resumed monitor must credit once");

			fetcher->deferring = true;
			VI_PANIC(timers.step() && fetcher->deferred.size() == 2 && monitor->state().polling, "next cycle must wait on the fetcher");
			VI_PANIC(supervisor.unwatch("BTC", "bc1qtarget") && supervisor.size() == 0 && timers.pending() == 0, "unwatch must detach the monitor");

			fetcher->deferred.back().set(expects_rt<vector<warden::observed_transaction>>(batch));
			VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1 && counter.get(events::topics::deposit_pending()) == 0 && timers.pending() == 0, "released monitor must stay silent");

			status = supervisor.watch(watched(wallet, "BTC", "bc1qtarget")).get();
			VI_PANIC(status && timers.step() && fetcher->deferred.size() == 3, "rewatched address must poll again");
		}

		VI_PANIC(timers.pending() == 0, "supervisor teardown must stop its monitors");
		fetcher->deferred.back().set(expects_rt<vector<warden::observed_transaction>>(batch));
		VI_PANIC(counter.get(events::topics::deposit_confirmed()) == 1, "cycle settling after teardown must not credit");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		auto records = ledger.get_transactions(wallet.id, ledger::transaction_status::confirmed).expect("transaction lookup failed");
		VI_PANIC(balance.balance == number("0.3") && records.size() == 1, "deposit must be credited exactly once");
	}
	static void settlement_fee_model(protocol& params)
	{
		use_monitor_options(params);
		fee_policy policy;
		policy.percentage = number("0.5");
		policy.minimum = decimal(2);
		VI_PANIC(settlement::fee_calculator::compute_service_fee(decimal(1000), policy) == decimal(5), "percentage fee must apply above the floor");
		VI_PANIC(settlement::fee_calculator::compute_service_fee(decimal(100), policy) == decimal(2), "floor must apply below the threshold");

		auto registry = evm_registry(decimal(5), decimal(2));
		settlement::fee_calculator calculator = settlement::fee_calculator(registry);
		auto fees = calculator.compute_fee(decimal(100), "ETH", "ETH", "0xabc0000000000000000000000000000000000001").get();
		VI_PANIC(fees && fees->service_fee == decimal(5) && fees->network_fee == decimal::zero() && fees->total == decimal(5), "static fee policy is wrong");

		auto unknown = calculator.compute_fee(decimal(100), "SOL", "SOL", "address").get();
		VI_PANIC(!unknown && stringify::starts_with(unknown.what(), "unsupported chain"), "unknown chain must be rejected");

		bool activated = false;
		fake_channel channel;
		manual_scheduler timers;
		channel.route = [&activated](const warden::http_request& request)
		{
			if (stringify::find(request.url, "/wallet/getchainparameters").found)
				return fake_channel::reply(200, "{\"chainParameter\":[{\"key\":\"getEnergyFee\",\"value\":420},{\"key\":\"getTransactionFee\",\"value\":1000}]}");
			else if (stringify::find(request.url, "/v1/accounts/").found)
				return fake_channel::reply(200, activated ? "{\"data\":[{\"balance\":1}],\"success\":true}" : "{\"data\":[],\"success\":true}");
			return fake_channel::reply(404, "not found", "text/plain");
		};

		token_descriptor token;
		token.chain = "TRON";
		token.currency = "TRX";
		token.fees.percentage = decimal(1);
		token.decimals = (uint8_t)6;
		vector<chain_descriptor> chains;
		chains.push_back(tron_descriptor());
		vector<token_descriptor> tokens;
		tokens.push_back(std::move(token));
		auto tron_registry = chain_registry(std::move(chains), std::move(tokens));
		auto* tron = *tron_registry.get_chain("TRON");

		warden::server_relay relay = warden::server_relay(params, &channel, &timers, std::string_view());
		warden::fetcher_set estimators;
		estimators.assign(*tron, uptr<warden::fee_estimator>(memory::init<warden::backends::tron_estimator>(relay, *tron)));
		settlement::fee_calculator tron_calculator = settlement::fee_calculator(tron_registry, &estimators);
		auto unfunded = tron_calculator.compute_fee(decimal(10), "TRON", "TRX", "TXYZopYRdj2D9XRtbG411XZZ3kM5VkAeBf").get();
		VI_PANIC(unfunded && unfunded->network_fee == number("0.267") && unfunded->activation_fee == decimal(1) && unfunded->service_fee == number("0.1"), "unfunded destination must pay activation");
		VI_PANIC(unfunded->total == number("1.367"), "fee total is wrong");

		activated = true;
		auto funded = tron_calculator.compute_fee(decimal(10), "TRON", "TRX", "TXYZopYRdj2D9XRtbG411XZZ3kM5VkAeBf").get();
		VI_PANIC(funded && funded->activation_fee == decimal::zero() && funded->total == number("0.367"), "funded destination must not pay activation");
	}
	static void settlement_validation(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		auto registry = evm_registry(decimal::zero(), decimal::zero(), 8);
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "ETH", decimal(10)).expect("wallet creation failed");
		events::event_broadcaster broadcaster;
		settlement::fee_calculator calculator = settlement::fee_calculator(registry);
		settlement::withdrawal_queue queue = settlement::withdrawal_queue(params, registry, calculator, ledger, broadcaster);

		settlement::withdrawal_request request;
		request.user_id = "user1";
		request.wallet_id = wallet.id;
		request.chain = "ETH";
		request.currency = "ETH";
		request.to_address = "0xabc0000000000000000000000000000000000001";
		request.amount = number("1.123456789");
		auto rejected = queue.settle(request).get();
		VI_PANIC(!rejected && stringify::starts_with(rejected.what(), "precision exceeded"), "nine decimal places must exceed precision 8");

		request.amount = number("1.12345678");
		auto accepted = queue.settle(request).get();
		VI_PANIC(accepted && accepted->record.status == ledger::transaction_status::pending && accepted->balance.balance == number("8.87654322"), "eight decimal places must be accepted");

		request.amount = decimal(1);
		request.to_address = "0xnothex";
		auto bad_address = queue.settle(request).get();
		VI_PANIC(!bad_address && stringify::starts_with(bad_address.what(), "invalid address"), "malformed evm address must be rejected");

		auto tron = tests::tron_descriptor();
		VI_PANIC(settlement::withdrawal_queue::validate_address(tron, "TXYZopYRdj2D9XRtbG411XZZ3kM5VkAeBf"), "valid tron address must pass");
		VI_PANIC(!settlement::withdrawal_queue::validate_address(tron, "TXYZopYRdj2D9XRtbG411XZZ3kM5VkAeB0"), "tron address with non-base58 symbols must fail");
		VI_PANIC(settlement::withdrawal_queue::validate_address(utxo_descriptor(), "bc1qanything"), "utxo addresses are not validated");

		request.to_address = "0xabc0000000000000000000000000000000000001";
		request.user_id = "intruder";
		auto foreign = queue.settle(request).get();
		VI_PANIC(!foreign && stringify::starts_with(foreign.what(), "wallet not found"), "foreign wallet must be rejected");

		request.user_id = "user1";
		request.amount = decimal(20);
		auto overdraft = queue.settle(request).get();
		VI_PANIC(!overdraft && stringify::starts_with(overdraft.what(), "insufficient funds"), "overdraft must be rejected before any mutation");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		auto pending = ledger.get_transactions(wallet.id, ledger::transaction_status::pending).expect("transaction lookup failed");
		VI_PANIC(balance.balance == number("8.87654322") && pending.size() == 1, "rejections must not mutate the ledger");
	}
	static void settlement_balance_safety(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		auto registry = evm_registry(decimal::zero(), decimal::zero());
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto wallet = ledger.create_wallet("user1", "ETH", decimal(100)).expect("wallet creation failed");
		events::event_broadcaster broadcaster;
		settlement::fee_calculator calculator = settlement::fee_calculator(registry);
		settlement::withdrawal_queue queue = settlement::withdrawal_queue(params, registry, calculator, ledger, broadcaster);

		settlement::withdrawal_request request;
		request.user_id = "user1";
		request.wallet_id = wallet.id;
		request.chain = "ETH";
		request.currency = "ETH";
		request.to_address = "0xabc0000000000000000000000000000000000001";
		request.amount = decimal(60);

		std::atomic<size_t> successes(0), rejections(0);
		auto worker = [&]()
		{
			auto result = queue.settle(request).get();
			if (result)
				++successes;
			else if (stringify::starts_with(result.what(), "insufficient funds"))
				++rejections;
		};

		std::thread first(worker), second(worker);
		first.join();
		second.join();
		VI_PANIC(successes == 1 && rejections == 1, "exactly one concurrent withdrawal must pass");

		auto balance = ledger.get_wallet(wallet.id).expect("wallet lookup failed");
		VI_PANIC(balance.balance == decimal(40) && !balance.balance.is_negative(), "balance must be debited once");
	}
	static void settlement_dispatch_and_reject(protocol& params)
	{
		use_clean_state(params);
		use_monitor_options(params);
		auto registry = evm_registry(decimal(1), decimal::zero());
		storages::ledgerstate ledger = storages::ledgerstate(params.database);
		auto sender = ledger.create_wallet("user1", "ETH", decimal(100)).expect("wallet creation failed");
		auto recipient = ledger.create_wallet("user2", "ETH").expect("wallet creation failed");
		ledger.assign_address(recipient.id, "ETH", "0xbbb0000000000000000000000000000000000002").expect("address assignment failed");
		events::event_broadcaster broadcaster;
		event_counter counter;
		counter.attach(broadcaster);
		settlement::fee_calculator calculator = settlement::fee_calculator(registry);
		settlement::withdrawal_queue queue = settlement::withdrawal_queue(params, registry, calculator, ledger, broadcaster);
		auto* dispatcher = memory::init<recorded_dispatcher>();
		queue.assign_dispatcher("eth", dispatcher);

		settlement::withdrawal_request request;
		request.user_id = "user1";
		request.wallet_id = sender.id;
		request.chain = "ETH";
		request.currency = "ETH";
		request.to_address = "0xabc0000000000000000000000000000000000001";
		request.raw_transaction = "f86b80";
		request.amount = decimal(10);
		auto withdrawal = queue.settle(request).get();
		VI_PANIC(withdrawal && !withdrawal->internal && withdrawal->fees.total == number("0.1") && withdrawal->balance.balance == number("89.9"), "withdrawal must debit amount plus fee");
		VI_PANIC(counter.get(events::topics::withdrawal_pending()) == 1, "pending withdrawal must be announced");

		string id = withdrawal->record.id;
		VI_PANIC(queue.submit(id) && queue.submit(id) && queue.pending() == 1, "submit must admit a withdrawal once");

		dispatcher->failing = true;
		VI_PANIC(queue.dispatch().get() == 0 && queue.pending() == 1, "failed broadcast must stay queued");

		auto record = ledger.get_transaction(id).expect("transaction lookup failed");
		VI_PANIC(record.status == ledger::transaction_status::pending && record.hash.empty(), "failed broadcast must leave the record pending");

		dispatcher->failing = false;
		VI_PANIC(queue.dispatch().get() == 1 && queue.pending() == 0, "broadcast must drain the queue");

		record = ledger.get_transaction(id).expect("transaction lookup failed");
		VI_PANIC(record.hash == "tx-" + id && record.status == ledger::transaction_status::pending, "broadcast hash must be recorded");
		VI_PANIC(counter.get(events::topics::withdrawal_broadcast()) == 1, "broadcast must be announced");
		VI_PANIC(!queue.submit(id), "broadcast withdrawal must not be resubmitted");

		request.amount = decimal(20);
		auto second = queue.settle(request).get();
		VI_PANIC(second && second->balance.balance == number("69.7"), "second withdrawal must be debited");

		auto refunded = queue.reject(second->record.id);
		VI_PANIC(refunded && refunded->balance == number("89.9"), "rejection must refund amount plus fee");
		VI_PANIC(!queue.reject(second->record.id), "rejection must happen once");
		VI_PANIC(ledger.get_transaction(second->record.id).expect("transaction lookup failed").status == ledger::transaction_status::failed, "rejected withdrawal must fail");
		VI_PANIC(counter.get(events::topics::withdrawal_rejected()) == 1, "rejection must be announced");

		request.to_address = "0xbbb0000000000000000000000000000000000002";
		request.amount = decimal(10);
		auto transfer = queue.settle(request).get();
		VI_PANIC(transfer && transfer->internal && transfer->record.type == ledger::transaction_type::outgoing_transfer, "deposit address of another wallet must settle internally");
		VI_PANIC(transfer->balance.balance == number("79.8") && counter.get(events::topics::transfer_completed()) == 1, "internal transfer must charge only the service fee");

		auto credited = ledger.get_wallet(recipient.id).expect("wallet lookup failed");
		auto incoming = ledger.get_transactions(recipient.id, ledger::transaction_status::confirmed).expect("transaction lookup failed");
		VI_PANIC(credited.balance == decimal(10) && incoming.size() == 1 && incoming.front().type == ledger::transaction_type::incoming_transfer, "recipient must be credited");
		VI_PANIC(dispatcher->broadcasted.size() == 1, "internal transfer must not be broadcast");
	}
};

class runners
{
public:
	/* offline regression cases, no network or wall clock involved */
	static int regression(inline_args& args, protocol& params)
	{
		vector<std::pair<std::string_view, std::function<void()>>> cases =
		{
			{ "registry / default chains", &tests::registry_default_chains },
			{ "events / subscriber isolation", &tests::events_subscriber_isolation },
			{ "ledger / idempotent credit", std::bind(&tests::ledger_idempotent_credit, std::ref(params)) },
			{ "relay / retry backoff", std::bind(&tests::relay_retry_backoff, std::ref(params)) },
			{ "node / wallet recovery", std::bind(&tests::node_wallet_recovery, std::ref(params)) },
			{ "node / transaction queries", std::bind(&tests::node_transaction_queries, std::ref(params)) },
			{ "fetcher / utxo receive aggregation", std::bind(&tests::utxo_receive_aggregation, std::ref(params)) },
			{ "fetcher / explorer responses", std::bind(&tests::explorer_responses, std::ref(params)) },
			{ "fetcher / explorer cached history", std::bind(&tests::explorer_cached_history, std::ref(params)) },
			{ "monitor / confirmation progress", std::bind(&tests::monitor_confirmation_progress, std::ref(params)) },
			{ "monitor / restart idempotency", std::bind(&tests::monitor_restart_idempotency, std::ref(params)) },
			{ "monitor / fail stop", std::bind(&tests::monitor_fail_stop, std::ref(params)) },
			{ "monitor / supervisor lifecycle", std::bind(&tests::supervisor_watch_lifecycle, std::ref(params)) },
			{ "monitor / persistence retry", std::bind(&tests::monitor_persistence_retry, std::ref(params)) },
			{ "monitor / malformed response", std::bind(&tests::monitor_malformed_response, std::ref(params)) },
			{ "monitor / cycle in flight", std::bind(&tests::monitor_inflight_cycle, std::ref(params)) },
			{ "settlement / fee model", std::bind(&tests::settlement_fee_model, std::ref(params)) },
			{ "settlement / validation", std::bind(&tests::settlement_validation, std::ref(params)) },
			{ "settlement / balance safety", std::bind(&tests::settlement_balance_safety, std::ref(params)) },
			{ "settlement / dispatch and reject", std::bind(&tests::settlement_dispatch_and_reject, std::ref(params)) },
		};

		auto* term = console::get();
		for (size_t i = 0; i < cases.size(); i++)
		{
			auto& [name, function] = cases[i];
			term->write_color(std_color::black, std_color::yellow);
			term->fwrite("  ===>  %s  <===  ", name.data());
			term->clear_color();
			term->write_char('\n');
			term->capture_time();

			function();

			double time = term->get_captured_time();
			term->write_color(std_color::white, std_color::dark_green);
			term->fwrite("  TEST PASS %.1fms %.2f%%  ", time, 100.0 * (double)(i + 1) / (double)cases.size());
			term->clear_color();
			term->write("\n\n");
		}

		tests::use_clean_state(params);
		return 0;
	}
};

int main(int argc, char* argv[])
{
	vitex::runtime scope;
	inline_args args = os::process::parse_args(argc, argv, (size_t)args_format::key | (size_t)args_format::key_value);
	protocol params = protocol(args);
	if (!params.custom())
		params.user.storage.path = "./custody_test/";

	auto* term = console::get();
	term->show();

	int bad_entrypoint_exit_code = 0x39ce8025;
	int exit_code = bad_entrypoint_exit_code;
	auto test = args.get("test");
	if (test == "regression")
		exit_code = runners::regression(args, params);

	VI_PANIC(exit_code != bad_entrypoint_exit_code, "must provide a \"test\" flag (string in [regression])");
	if (os::process::has_debugger())
	{
		term->write("\n");
		term->write_color(std_color::white, std_color::dark_green);
		term->fwrite("  %s TEST PASS  ", stringify::to_upper(test).c_str());
		term->clear_color();
		term->write("\n\n");
		term->read_char();
	}
	return exit_code;
}
