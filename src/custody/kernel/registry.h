#ifndef CST_KERNEL_REGISTRY_H
#define CST_KERNEL_REGISTRY_H
#include "chain.h"

namespace custody
{
	enum class chain_family
	{
		utxo,
		account,
		explorer_only
	};

	enum class transport_policy
	{
		node_rpc,
		explorer_api,
		third_party_service
	};

	enum class chain_backend
	{
		bitcoin_node,
		etherscan,
		trongrid,
		monero_wallet
	};

	struct fee_policy
	{
		decimal percentage = decimal::zero();
		decimal minimum = decimal::zero();
		decimal activation = decimal::zero();
		bool requires_activation = false;
		bool dynamic_estimation = false;
	};

	struct network_endpoint
	{
		string explorer;
		uint64_t chain_id = 0;
	};

	struct transport_config
	{
		transport_policy policy = transport_policy::node_rpc;
		unordered_map<string, network_endpoint> networks;
		network_endpoint endpoint;
		string network;
		string api_key;
		string node_url;
		string node_username;
		string node_password;
		string node_wallet;
		double rps = 0.0;
		bool explorer_api = true;
		bool cache = false;
		bool rescan_on_watch = false;
	};

	struct chain_descriptor
	{
		string id;
		string name;
		string currency;
		chain_family family = chain_family::utxo;
		chain_backend backend = chain_backend::bitcoin_node;
		transport_config transport;
		fee_policy fees;
		uint64_t required_confirmations = 0;
		uint8_t decimals = 8;

		decimal divisibility() const;
		decimal to_standard(const decimal& minor_units) const;
		decimal to_minor(const decimal& standard_units) const;
		bool is_evm() const;
	};

	struct token_descriptor
	{
		string chain;
		string currency;
		fee_policy fees;
		option<uint8_t> precision = optional::none;
		option<uint8_t> decimals = optional::none;

		uint8_t withdrawal_precision() const;
	};

	class chain_registry
	{
	private:
		unordered_map<string, chain_descriptor> chains;
		unordered_map<string, token_descriptor> tokens;

	public:
		chain_registry(protocol& params);
		chain_registry(vector<chain_descriptor>&& descriptors, vector<token_descriptor>&& new_tokens = { });
		chain_registry(const chain_registry&) = delete;
		chain_registry& operator=(const chain_registry&) = delete;
		expects_lr<const chain_descriptor*> get_chain(const std::string_view& id) const;
		expects_lr<const token_descriptor*> get_token(const std::string_view& chain, const std::string_view& currency) const;
		vector<const chain_descriptor*> get_chains(chain_family family) const;
		vector<const chain_descriptor*> get_chains() const;
		bool has_chain(const std::string_view& id) const;

	public:
		static vector<chain_descriptor> default_chains();

	private:
		void insert(chain_descriptor&& descriptor);
		void insert(token_descriptor&& descriptor);
		static string key_of(const std::string_view& chain, const std::string_view& currency);
	};
}
#endif
