#include "ledger.h"

namespace custody
{
	namespace ledger
	{
		persisted_transaction::persisted_transaction(const persisted_transaction& other) : id(other.id), hash(other.hash), wallet_id(other.wallet_id), chain(other.chain), currency(other.currency), address(other.address), type(other.type), status(other.status), amount(other.amount), fee(other.fee), metadata(other.metadata ? other.metadata->copy() : nullptr), created_at(other.created_at)
		{
		}
		persisted_transaction& persisted_transaction::operator=(const persisted_transaction& other)
		{
			if (this == &other)
				return *this;

			id = other.id;
			hash = other.hash;
			wallet_id = other.wallet_id;
			chain = other.chain;
			currency = other.currency;
			address = other.address;
			type = other.type;
			status = other.status;
			amount = other.amount;
			fee = other.fee;
			metadata = other.metadata ? other.metadata->copy() : nullptr;
			created_at = other.created_at;
			return *this;
		}
		uptr<schema> persisted_transaction::as_schema() const
		{
			schema* data = var::set::object();
			data->set("id", var::string(id));
			data->set("hash", hash.empty() ? var::null() : var::string(hash));
			data->set("wallet_id", var::string(wallet_id));
			data->set("chain", var::string(chain));
			data->set("currency", var::string(currency));
			data->set("address", var::string(address));
			data->set("type", var::string(ledger_util::type_name(type)));
			data->set("status", var::string(ledger_util::status_name(status)));
			data->set("amount", var::string(amount.to_string()));
			data->set("fee", var::string(fee.to_string()));
			data->set("metadata", metadata ? metadata->copy() : var::set::null());
			data->set("created_at", var::integer(created_at));
			return data;
		}
		bool persisted_transaction::is_valid() const
		{
			return !id.empty() && !wallet_id.empty() && !chain.empty() && !amount.is_nan() && !fee.is_nan() && !amount.is_negative() && !fee.is_negative();
		}

		decimal wallet_balance::available() const
		{
			return balance - in_order;
		}
		uptr<schema> wallet_balance::as_schema() const
		{
			schema* data = var::set::object();
			data->set("id", var::string(id));
			data->set("user_id", var::string(user_id));
			data->set("currency", var::string(currency));
			data->set("balance", var::string(balance.to_string()));
			data->set("in_order", var::string(in_order.to_string()));
			return data;
		}

		std::string_view ledger_util::status_name(transaction_status status)
		{
			switch (status)
			{
				case transaction_status::pending:
					return "PENDING";
				case transaction_status::confirmed:
					return "CONFIRMED";
				case transaction_status::failed:
					return "FAILED";
				default:
					return "UNKNOWN";
			}
		}
		std::string_view ledger_util::type_name(transaction_type type)
		{
			switch (type)
			{
				case transaction_type::deposit:
					return "DEPOSIT";
				case transaction_type::withdraw:
					return "WITHDRAW";
				case transaction_type::incoming_transfer:
					return "INCOMING_TRANSFER";
				case transaction_type::outgoing_transfer:
					return "OUTGOING_TRANSFER";
				default:
					return "UNKNOWN";
			}
		}
		option<transaction_status> ledger_util::status_of(const std::string_view& name)
		{
			if (name == "PENDING")
				return transaction_status::pending;
			else if (name == "CONFIRMED")
				return transaction_status::confirmed;
			else if (name == "FAILED")
				return transaction_status::failed;
			return optional::none;
		}
		option<transaction_type> ledger_util::type_of(const std::string_view& name)
		{
			if (name == "DEPOSIT")
				return transaction_type::deposit;
			else if (name == "WITHDRAW")
				return transaction_type::withdraw;
			else if (name == "INCOMING_TRANSFER")
				return transaction_type::incoming_transfer;
			else if (name == "OUTGOING_TRANSFER")
				return transaction_type::outgoing_transfer;
			return optional::none;
		}
		uint32_t ledger_util::decimal_places_of(const decimal& value)
		{
			if (value.is_nan())
				return 0;

			string text = value.to_string();
			size_t point = text.find('.');
			if (point == string::npos)
				return 0;

			size_t end = text.size();
			while (end > point + 1 && text[end - 1] == '0')
				--end;
			return (uint32_t)(end - point - 1);
		}
		string ledger_util::generate_id()
		{
			auto data = crypto::random_bytes(16);
			if (!data)
				return stringify::text("%" PRIu64 "%" PRIu64, (uint64_t)date_time().milliseconds(), (uint64_t)crypto::random());

			return codec::hex_encode(*data);
		}
		int64_t ledger_util::timestamp()
		{
			return (int64_t)(date_time().milliseconds() / 1000);
		}
	}
}
