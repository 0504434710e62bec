#include "registry.h"

namespace custody
{
	static string upper_of(const std::string_view& value)
	{
		string result = string(value);
		stringify::to_upper(result);
		return result;
	}
	static chain_descriptor utxo_chain(const std::string_view& id, const std::string_view& name, uint16_t port, uint64_t confirmations)
	{
		chain_descriptor result;
		result.id = id;
		result.name = name;
		result.currency = id;
		result.family = chain_family::utxo;
		result.backend = chain_backend::bitcoin_node;
		result.decimals = 8;
		result.required_confirmations = confirmations;
		result.transport.policy = transport_policy::node_rpc;
		result.transport.node_url = stringify::text("http://127.0.0.1:%i", (int)port);
		result.transport.node_wallet = "ecosystem_wallets";
		return result;
	}
	static chain_descriptor explorer_chain(const std::string_view& id, const std::string_view& name, const std::string_view& currency, std::initializer_list<std::pair<string, network_endpoint>> networks)
	{
		chain_descriptor result;
		result.id = id;
		result.name = name;
		result.currency = currency;
		result.family = chain_family::account;
		result.backend = chain_backend::etherscan;
		result.decimals = 18;
		result.required_confirmations = 12;
		result.transport.policy = transport_policy::explorer_api;
		result.transport.cache = true;
		for (auto& [network, endpoint] : networks)
			result.transport.networks[network] = endpoint;
		return result;
	}

	decimal chain_descriptor::divisibility() const
	{
		string value = "1";
		value.append((size_t)decimals, '0');
		return decimal(std::string_view(value));
	}
	decimal chain_descriptor::to_standard(const decimal& minor_units) const
	{
		return minor_units / divisibility();
	}
	decimal chain_descriptor::to_minor(const decimal& standard_units) const
	{
		decimal result = standard_units * divisibility();
		return result.truncate(0);
	}
	bool chain_descriptor::is_evm() const
	{
		return backend == chain_backend::etherscan;
	}

	uint8_t token_descriptor::withdrawal_precision() const
	{
		if (precision)
			return *precision;
		else if (decimals)
			return *decimals;
		return 8;
	}

	chain_registry::chain_registry(protocol& params)
	{
		for (auto& descriptor : default_chains())
		{
			params.apply_environment(descriptor.id);
			auto& config = params.chain(descriptor.id);
			if (config.confirmations > 0)
				descriptor.required_confirmations = config.confirmations;

			auto& transport = descriptor.transport;
			if (!config.network.empty())
				transport.network = config.network;
			transport.api_key = config.explorer_api_key;
			transport.rps = config.rps;
			transport.rescan_on_watch = config.rescan_on_watch;
			if (!transport.node_url.empty())
			{
				location origin(transport.node_url);
				uint16_t port = config.node.port > 0 ? config.node.port : (uint16_t)origin.port;
				string host = config.node.host.empty() ? origin.hostname : config.node.host;
				transport.node_url = stringify::text("http://%s:%i", host.c_str(), (int)port);
				transport.node_username = config.node.username;
				transport.node_password = config.node.password;
				if (!config.node.wallet.empty() && transport.policy == transport_policy::node_rpc)
					transport.node_wallet = config.node.wallet;
			}
			if (!transport.networks.empty())
			{
				auto it = transport.networks.find(transport.network);
				if (it != transport.networks.end())
					transport.endpoint = it->second;
			}
			insert(std::move(descriptor));
		}

		for (auto& [chain_id, currencies] : params.user.tokens)
		{
			for (auto& [currency, config] : currencies)
			{
				token_descriptor token;
				token.chain = chain_id;
				token.currency = currency;
				token.fees.percentage = config.fee_percentage;
				token.fees.minimum = config.fee_minimum;
				if (config.decimals > 0)
					token.decimals = config.decimals;
				if (config.precision >= 0)
					token.precision = (uint8_t)config.precision;

				auto chain = get_chain(chain_id);
				if (chain)
				{
					token.fees.activation = (*chain)->fees.activation;
					token.fees.requires_activation = (*chain)->fees.requires_activation;
					token.fees.dynamic_estimation = (*chain)->fees.dynamic_estimation;
				}
				insert(std::move(token));
			}
		}
	}
	chain_registry::chain_registry(vector<chain_descriptor>&& descriptors, vector<token_descriptor>&& new_tokens)
	{
		for (auto& descriptor : descriptors)
			insert(std::move(descriptor));
		for (auto& token : new_tokens)
			insert(std::move(token));
	}
	expects_lr<const chain_descriptor*> chain_registry::get_chain(const std::string_view& id) const
	{
		auto it = chains.find(upper_of(id));
		if (it == chains.end())
			return layer_exception::unsupported_chain(id);

		return &it->second;
	}
	expects_lr<const token_descriptor*> chain_registry::get_token(const std::string_view& chain, const std::string_view& currency) const
	{
		auto it = tokens.find(key_of(chain, currency));
		if (it == tokens.end())
		{
			if (!has_chain(chain))
				return layer_exception::unsupported_chain(chain);

			return layer_exception(stringify::text("token not found: %.*s on %.*s", (int)currency.size(), currency.data(), (int)chain.size(), chain.data()));
		}

		return &it->second;
	}
	vector<const chain_descriptor*> chain_registry::get_chains(chain_family family) const
	{
		vector<const chain_descriptor*> result;
		for (auto& [id, descriptor] : chains)
		{
			if (descriptor.family == family)
				result.push_back(&descriptor);
		}
		std::sort(result.begin(), result.end(), [](const chain_descriptor* a, const chain_descriptor* b) { return a->id < b->id; });
		return result;
	}
	vector<const chain_descriptor*> chain_registry::get_chains() const
	{
		vector<const chain_descriptor*> result;
		result.reserve(chains.size());
		for (auto& [id, descriptor] : chains)
			result.push_back(&descriptor);
		std::sort(result.begin(), result.end(), [](const chain_descriptor* a, const chain_descriptor* b) { return a->id < b->id; });
		return result;
	}
	bool chain_registry::has_chain(const std::string_view& id) const
	{
		return chains.find(upper_of(id)) != chains.end();
	}
	void chain_registry::insert(chain_descriptor&& descriptor)
	{
		descriptor.id = upper_of(descriptor.id);
		auto native_key = key_of(descriptor.id, descriptor.currency);
		if (tokens.find(native_key) == tokens.end())
		{
			token_descriptor native;
			native.chain = descriptor.id;
			native.currency = upper_of(descriptor.currency);
			native.fees = descriptor.fees;
			native.decimals = descriptor.decimals;
			tokens[native_key] = std::move(native);
		}
		chains[descriptor.id] = std::move(descriptor);
	}
	void chain_registry::insert(token_descriptor&& descriptor)
	{
		descriptor.chain = upper_of(descriptor.chain);
		descriptor.currency = upper_of(descriptor.currency);
		tokens[key_of(descriptor.chain, descriptor.currency)] = std::move(descriptor);
	}
	vector<chain_descriptor> chain_registry::default_chains()
	{
		vector<chain_descriptor> result;
		result.push_back(utxo_chain("BTC", "Bitcoin", 8332, 3));
		result.push_back(utxo_chain("LTC", "Litecoin", 9332, 6));
		result.push_back(utxo_chain("DOGE", "Dogecoin", 22555, 6));
		result.push_back(utxo_chain("DASH", "Dash", 9998, 6));
		result.push_back(explorer_chain("ETH", "Ethereum", "ETH", { { "mainnet", { "api.etherscan.io", 1 } }, { "sepolia", { "api-sepolia.etherscan.io", 11155111 } } }));
		result.push_back(explorer_chain("BSC", "Binance Smart Chain", "BNB", { { "mainnet", { "api.bscscan.com", 56 } }, { "testnet", { "api-testnet.bscscan.com", 97 } } }));
		result.push_back(explorer_chain("POLYGON", "Polygon", "MATIC", { { "matic", { "api.polygonscan.com", 137 } }, { "matic-mumbai", { "api-testnet.polygonscan.com", 80001 } } }));
		result.push_back(explorer_chain("FTM", "Fantom", "FTM", { { "mainnet", { "api.ftmscan.com", 250 } }, { "testnet", { "api-testnet.ftmscan.com", 4002 } } }));
		result.push_back(explorer_chain("OPTIMISM", "Optimism", "ETH", { { "mainnet", { "api-optimistic.etherscan.io", 10 } }, { "goerli", { "api-goerli-optimistic.etherscan.io", 420 } } }));
		result.push_back(explorer_chain("ARBITRUM", "Arbitrum", "ETH", { { "mainnet", { "api.arbiscan.io", 42161 } }, { "goerli", { "api-goerli.arbiscan.io", 421613 } } }));
		result.push_back(explorer_chain("BASE", "Base", "ETH", { { "mainnet", { "api.basescan.org", 8453 } }, { "goerli", { "api-goerli.basescan.org", 84531 } } }));
		result.push_back(explorer_chain("CELO", "Celo", "CELO", { { "mainnet", { "api.celoscan.io", 42220 } }, { "alfajores", { "api-alfajores.celoscan.io", 44787 } } }));
		result.push_back(explorer_chain("CRONOS", "Cronos", "CRON", { { "mainnet", { "api.cronoscan.com", 25 } } }));

		chain_descriptor tron;
		tron.id = "TRON";
		tron.name = "Tron";
		tron.currency = "TRX";
		tron.family = chain_family::explorer_only;
		tron.backend = chain_backend::trongrid;
		tron.decimals = 6;
		tron.required_confirmations = 1;
		tron.fees.activation = decimal(1);
		tron.fees.requires_activation = true;
		tron.fees.dynamic_estimation = true;
		tron.transport.policy = transport_policy::third_party_service;
		tron.transport.networks["mainnet"] = { "api.trongrid.io", 0 };
		tron.transport.networks["shasta"] = { "api.shasta.trongrid.io", 0 };
		tron.transport.networks["nile"] = { "api.nileex.io", 0 };
		tron.transport.network = "mainnet";
		tron.transport.explorer_api = false;
		result.push_back(std::move(tron));

		chain_descriptor monero;
		monero.id = "XMR";
		monero.name = "Monero";
		monero.currency = "XMR";
		monero.family = chain_family::explorer_only;
		monero.backend = chain_backend::monero_wallet;
		monero.decimals = 12;
		monero.required_confirmations = 10;
		monero.fees.dynamic_estimation = true;
		monero.transport.policy = transport_policy::third_party_service;
		monero.transport.node_url = "http://127.0.0.1:18082";
		monero.transport.explorer_api = false;
		result.push_back(std::move(monero));
		return result;
	}
	string chain_registry::key_of(const std::string_view& chain, const std::string_view& currency)
	{
		return upper_of(chain) + ":" + upper_of(currency);
	}
}
