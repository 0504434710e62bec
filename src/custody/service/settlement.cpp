#include "settlement.h"

namespace custody
{
	namespace settlement
	{
		static string upper_of(const std::string_view& value)
		{
			string result = string(value);
			stringify::to_upper(result);
			return result;
		}
		static bool is_base58(char symbol)
		{
			if (symbol >= '1' && symbol <= '9')
				return true;
			else if (symbol >= 'A' && symbol <= 'Z')
				return symbol != 'I' && symbol != 'O';
			else if (symbol >= 'a' && symbol <= 'z')
				return symbol != 'l';
			return false;
		}

		uptr<schema> fee_breakdown::as_schema() const
		{
			schema* data = var::set::object();
			data->set("network_fee", var::string(network_fee.to_string()));
			data->set("activation_fee", var::string(activation_fee.to_string()));
			data->set("service_fee", var::string(service_fee.to_string()));
			data->set("total", var::string(total.to_string()));
			return data;
		}

		uptr<schema> withdrawal_receipt::as_schema() const
		{
			schema* data = var::set::object();
			data->set("transaction", record.as_schema().reset());
			data->set("balance", balance.as_schema().reset());
			data->set("fees", fees.as_schema().reset());
			data->set("internal", var::boolean(internal));
			return data;
		}

		fee_calculator::fee_calculator(const chain_registry& new_registry, warden::fetcher_set* new_estimators) noexcept : registry(new_registry), estimators(new_estimators)
		{
		}
		expects_promise_lr<fee_breakdown> fee_calculator::compute_fee(const decimal& amount, const std::string_view& chain, const std::string_view& currency, const std::string_view& to_address)
		{
			auto descriptor = registry.get_chain(chain);
			if (!descriptor)
				coreturn expects_lr<fee_breakdown>(std::move(descriptor.error()));

			auto token = registry.get_token(chain, currency);
			if (!token)
				coreturn expects_lr<fee_breakdown>(std::move(token.error()));

			auto& policy = (*descriptor)->fees;
			auto* estimator = estimators ? estimators->get_estimator((*descriptor)->id) : nullptr;
			string address = string(to_address);

			fee_breakdown result;
			result.service_fee = compute_service_fee(amount, (*token)->fees);
			if (policy.requires_activation && estimator != nullptr && !address.empty())
			{
				auto activated = coawait(estimator->is_activated(address));
				if (!activated)
					coreturn expects_lr<fee_breakdown>(layer_exception(stringify::text("activation check failed: %s", activated.what().c_str())));
				else if (!*activated)
					result.activation_fee = policy.activation;
			}

			if (policy.dynamic_estimation && estimator != nullptr)
			{
				auto network_fee = coawait(estimator->estimate_network_fee(address));
				if (!network_fee)
					coreturn expects_lr<fee_breakdown>(layer_exception(stringify::text("network fee estimation failed: %s", network_fee.what().c_str())));

				result.network_fee = *network_fee;
			}

			result.total = result.network_fee + result.activation_fee + result.service_fee;
			coreturn expects_lr<fee_breakdown>(std::move(result));
		}
		decimal fee_calculator::compute_service_fee(const decimal& amount, const fee_policy& policy)
		{
			decimal percentage_fee = amount * policy.percentage / decimal(100);
			return percentage_fee > policy.minimum ? percentage_fee : policy.minimum;
		}

		node_dispatcher::node_dispatcher(warden::node_client& new_node) noexcept : node(new_node)
		{
		}
		expects_promise_rt<string> node_dispatcher::broadcast(const ledger::persisted_transaction& record)
		{
			auto* raw = record.metadata ? record.metadata->get("raw_transaction") : nullptr;
			string raw_transaction = raw ? raw->value.get_blob() : string();
			if (raw_transaction.empty())
				return expects_promise_rt<string>(remote_exception(stringify::text("unsigned withdrawal %s has no raw transaction", record.id.c_str())));

			return node.broadcast_raw(raw_transaction);
		}

		withdrawal_queue::withdrawal_queue(const protocol& params, const chain_registry& new_registry, fee_calculator& new_calculator, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster) noexcept : registry(new_registry), calculator(new_calculator), ledger(new_ledger), broadcaster(new_broadcaster), logging(params.user.settlement.logging)
		{
		}
		void withdrawal_queue::assign_dispatcher(const std::string_view& chain, uptr<withdrawal_dispatcher>&& dispatcher)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (dispatcher)
				dispatchers[upper_of(chain)] = std::move(dispatcher);
			else
				dispatchers.erase(upper_of(chain));
		}
		expects_promise_lr<withdrawal_receipt> withdrawal_queue::settle(const withdrawal_request& request)
		{
			withdrawal_request target = request;
			auto chain = registry.get_chain(target.chain);
			if (!chain)
				coreturn expects_lr<withdrawal_receipt>(std::move(chain.error()));

			auto token = registry.get_token(target.chain, target.currency);
			if (!token)
				coreturn expects_lr<withdrawal_receipt>(std::move(token.error()));

			if (target.amount.is_nan() || !target.amount.is_positive())
				coreturn expects_lr<withdrawal_receipt>(layer_exception("withdrawal amount must be positive"));

			auto precision = validate_precision(**token, target.amount);
			if (!precision)
				coreturn expects_lr<withdrawal_receipt>(std::move(precision.error()));

			auto address = validate_address(**chain, target.to_address);
			if (!address)
				coreturn expects_lr<withdrawal_receipt>(std::move(address.error()));

			auto wallet = ledger.get_wallet(target.wallet_id);
			if (!wallet)
				coreturn expects_lr<withdrawal_receipt>(std::move(wallet.error()));
			else if (wallet->user_id != target.user_id || upper_of(wallet->currency) != upper_of(target.currency))
				coreturn expects_lr<withdrawal_receipt>(layer_exception(stringify::text("wallet not found: %s", target.wallet_id.c_str())));

			auto recipient = ledger.find_address((*chain)->id, target.to_address);
			if (!recipient)
				coreturn expects_lr<withdrawal_receipt>(std::move(recipient.error()));
			else if (*recipient && (**recipient).wallet_id != target.wallet_id)
				coreturn settle_internal(target, **chain, **token, **recipient);

			auto fees = coawait(calculator.compute_fee(target.amount, (*chain)->id, target.currency, target.to_address));
			if (!fees)
				coreturn expects_lr<withdrawal_receipt>(std::move(fees.error()));

			uptr<schema> metadata = var::set::object();
			metadata->set("toAddress", var::string(target.to_address));
			metadata->set("fees", fees->as_schema().reset());
			if (!target.raw_transaction.empty())
				metadata->set("raw_transaction", var::string(target.raw_transaction));

			withdrawal_receipt receipt;
			receipt.fees = *fees;
			receipt.record.id = ledger::ledger_util::generate_id();
			receipt.record.wallet_id = target.wallet_id;
			receipt.record.chain = (*chain)->id;
			receipt.record.currency = target.currency;
			receipt.record.address = target.to_address;
			receipt.record.type = ledger::transaction_type::withdraw;
			receipt.record.status = ledger::transaction_status::pending;
			receipt.record.amount = target.amount;
			receipt.record.fee = fees->total;
			receipt.record.metadata = std::move(metadata);
			receipt.record.created_at = ledger::ledger_util::timestamp();

			auto balance = ledger.debit(target.wallet_id, target.amount + fees->total, &receipt.record);
			if (!balance)
			{
				if (logging)
					VI_WARN("[settlement] %s withdrawal of %s %s from wallet %s rejected: %s", receipt.record.chain.c_str(), target.amount.to_string().c_str(), target.currency.c_str(), target.wallet_id.c_str(), balance.what().c_str());
				coreturn expects_lr<withdrawal_receipt>(std::move(balance.error()));
			}

			receipt.balance = std::move(*balance);
			auto payload = receipt.as_schema();
			broadcaster.publish(events::topics::withdrawal_pending(), *payload);
			if (logging)
				VI_INFO("[settlement] %s withdrawal %s of %s %s created for wallet %s (fee: %s)", receipt.record.chain.c_str(), receipt.record.id.c_str(), target.amount.to_string().c_str(), target.currency.c_str(), target.wallet_id.c_str(), fees->total.to_string().c_str());
			coreturn expects_lr<withdrawal_receipt>(std::move(receipt));
		}
		expects_lr<void> withdrawal_queue::submit(const std::string_view& transaction_id)
		{
			auto record = ledger.get_transaction(transaction_id);
			if (!record)
				return record.error();
			else if (record->type != ledger::transaction_type::withdraw || record->status != ledger::transaction_status::pending)
				return layer_exception(stringify::text("transaction %s is not a pending withdrawal", record->id.c_str()));
			else if (!record->hash.empty())
				return layer_exception(stringify::text("withdrawal %s is already broadcast as %s", record->id.c_str(), record->hash.c_str()));

			umutex<std::recursive_mutex> unique(mutex);
			if (std::find(queue.begin(), queue.end(), record->id) == queue.end())
				queue.push_back(record->id);
			return expectation::met;
		}
		promise<size_t> withdrawal_queue::dispatch()
		{
			vector<string> batch;
			{
				umutex<std::recursive_mutex> unique(mutex);
				batch.reserve(queue.size());
				while (!queue.empty())
				{
					batch.push_back(std::move(queue.front()));
					queue.pop_front();
				}
			}

			size_t broadcasted = 0;
			vector<string> deferred;
			for (auto& id : batch)
			{
				auto record = ledger.get_transaction(id);
				if (!record)
				{
					VI_ERR("[settlement] withdrawal %s cannot be loaded: %s", id.c_str(), record.what().c_str());
					deferred.push_back(id);
					continue;
				}
				else if (record->status != ledger::transaction_status::pending || !record->hash.empty())
					continue;
				else if (!acquire_wallet(record->wallet_id))
				{
					deferred.push_back(id);
					continue;
				}

				auto hash = coawait(dispatch_one(*record));
				release_wallet(record->wallet_id);
				if (!hash)
				{
					VI_ERR("[settlement] %s withdrawal %s broadcast failed: %s", record->chain.c_str(), record->id.c_str(), hash.what().c_str());
					deferred.push_back(id);
					continue;
				}

				record->hash = *hash;
				if (!record->metadata)
					record->metadata = var::set::object();
				record->metadata->set("txid", var::string(*hash));
				auto status = ledger.update_transaction(*record);
				if (!status)
				{
					VI_ERR("[settlement] %s withdrawal %s broadcast as %s but not recorded: %s", record->chain.c_str(), record->id.c_str(), hash->c_str(), status.what().c_str());
					continue;
				}

				++broadcasted;
				auto payload = record->as_schema();
				broadcaster.publish(events::topics::withdrawal_broadcast(), *payload);
				if (logging)
					VI_INFO("[settlement] %s withdrawal %s broadcast as %s", record->chain.c_str(), record->id.c_str(), hash->c_str());
			}

			if (!deferred.empty())
			{
				umutex<std::recursive_mutex> unique(mutex);
				for (auto& id : deferred)
				{
					if (std::find(queue.begin(), queue.end(), id) == queue.end())
						queue.push_back(std::move(id));
				}
			}

			coreturn broadcasted;
		}
		expects_lr<ledger::wallet_balance> withdrawal_queue::reject(const std::string_view& transaction_id)
		{
			auto balance = ledger.refund(transaction_id);
			if (!balance)
				return balance.error();

			{
				umutex<std::recursive_mutex> unique(mutex);
				auto it = std::find(queue.begin(), queue.end(), transaction_id);
				if (it != queue.end())
					queue.erase(it);
			}

			auto record = ledger.get_transaction(transaction_id);
			uptr<schema> payload = record ? record->as_schema() : var::set::object();
			payload->set("balance", balance->as_schema().reset());
			broadcaster.publish(events::topics::withdrawal_rejected(), *payload);
			if (logging)
				VI_INFO("[settlement] withdrawal %.*s rejected and refunded", (int)transaction_id.size(), transaction_id.data());
			return balance;
		}
		size_t withdrawal_queue::pending()
		{
			umutex<std::recursive_mutex> unique(mutex);
			return queue.size();
		}
		expects_lr<void> withdrawal_queue::validate_address(const chain_descriptor& chain, const std::string_view& address)
		{
			if (address.empty())
				return layer_exception::invalid_address("destination address is empty");
			else if (chain.family == chain_family::utxo)
				return expectation::met;

			if (chain.is_evm())
			{
				if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X'))
					return layer_exception::invalid_address(stringify::text("%.*s is not a %s address", (int)address.size(), address.data(), chain.id.c_str()));

				for (size_t i = 2; i < address.size(); i++)
				{
					if (!isxdigit((uint8_t)address[i]))
						return layer_exception::invalid_address(stringify::text("%.*s is not a %s address", (int)address.size(), address.data(), chain.id.c_str()));
				}
			}
			else if (chain.backend == chain_backend::trongrid)
			{
				if (address.size() != 34 || address[0] != 'T')
					return layer_exception::invalid_address(stringify::text("%.*s is not a %s address", (int)address.size(), address.data(), chain.id.c_str()));

				for (char symbol : address)
				{
					if (!is_base58(symbol))
						return layer_exception::invalid_address(stringify::text("%.*s is not a %s address", (int)address.size(), address.data(), chain.id.c_str()));
				}
			}

			return expectation::met;
		}
		expects_lr<void> withdrawal_queue::validate_precision(const token_descriptor& token, const decimal& amount)
		{
			uint32_t places = ledger::ledger_util::decimal_places_of(amount);
			uint32_t precision = token.withdrawal_precision();
			if (places > precision)
				return layer_exception::precision_exceeded(stringify::text("amount %s has %i decimal places, %s %s allows %i", amount.to_string().c_str(), (int)places, token.chain.c_str(), token.currency.c_str(), (int)precision));

			return expectation::met;
		}
		expects_promise_rt<string> withdrawal_queue::dispatch_one(const ledger::persisted_transaction& record)
		{
			auto* dispatcher = get_dispatcher(record.chain);
			if (!dispatcher)
				return expects_promise_rt<string>(remote_exception(stringify::text("no broadcast route for %s", record.chain.c_str())));

			return dispatcher->broadcast(record);
		}
		expects_lr<withdrawal_receipt> withdrawal_queue::settle_internal(const withdrawal_request& request, const chain_descriptor& chain, const token_descriptor& token, const ledger::watched_address& recipient)
		{
			auto recipient_wallet = ledger.get_wallet(recipient.wallet_id);
			if (!recipient_wallet)
				return recipient_wallet.error();
			else if (upper_of(recipient_wallet->currency) != upper_of(request.currency))
				return layer_exception(stringify::text("recipient wallet %s does not hold %s", recipient.wallet_id.c_str(), request.currency.c_str()));

			withdrawal_receipt receipt;
			receipt.internal = true;
			receipt.fees.service_fee = fee_calculator::compute_service_fee(request.amount, token.fees);
			receipt.fees.total = receipt.fees.service_fee;

			string reference = ledger::ledger_util::generate_id();
			uptr<schema> metadata = var::set::object();
			metadata->set("fromWallet", var::string(request.wallet_id));
			metadata->set("toWallet", var::string(recipient.wallet_id));
			metadata->set("toAddress", var::string(request.to_address));
			metadata->set("reference", var::string(reference));

			receipt.record.id = ledger::ledger_util::generate_id();
			receipt.record.hash = reference;
			receipt.record.wallet_id = request.wallet_id;
			receipt.record.chain = chain.id;
			receipt.record.currency = request.currency;
			receipt.record.address = request.to_address;
			receipt.record.type = ledger::transaction_type::outgoing_transfer;
			receipt.record.status = ledger::transaction_status::confirmed;
			receipt.record.amount = request.amount;
			receipt.record.fee = receipt.fees.service_fee;
			receipt.record.metadata = metadata->copy();
			receipt.record.created_at = ledger::ledger_util::timestamp();

			ledger::persisted_transaction incoming = receipt.record;
			incoming.id = ledger::ledger_util::generate_id();
			incoming.wallet_id = recipient.wallet_id;
			incoming.type = ledger::transaction_type::incoming_transfer;
			incoming.fee = decimal::zero();

			auto balance = ledger.transfer(receipt.record, incoming);
			if (!balance)
				return balance.error();

			receipt.balance = std::move(*balance);
			auto payload = receipt.as_schema();
			payload->set("recipient", incoming.as_schema().reset());
			broadcaster.publish(events::topics::transfer_completed(), *payload);
			if (logging)
				VI_INFO("[settlement] %s internal transfer of %s %s from wallet %s to wallet %s", chain.id.c_str(), request.amount.to_string().c_str(), request.currency.c_str(), request.wallet_id.c_str(), recipient.wallet_id.c_str());
			return receipt;
		}
		withdrawal_dispatcher* withdrawal_queue::get_dispatcher(const std::string_view& chain)
		{
			umutex<std::recursive_mutex> unique(mutex);
			auto it = dispatchers.find(upper_of(chain));
			return it != dispatchers.end() ? *it->second : nullptr;
		}
		bool withdrawal_queue::acquire_wallet(const string& wallet_id)
		{
			umutex<std::recursive_mutex> unique(mutex);
			return busy_wallets.insert(wallet_id).second;
		}
		void withdrawal_queue::release_wallet(const string& wallet_id)
		{
			umutex<std::recursive_mutex> unique(mutex);
			busy_wallets.erase(wallet_id);
		}
	}
}
