#include "monitor.h"

namespace custody
{
	namespace deposits
	{
		static string upper_of(const std::string_view& value)
		{
			string result = string(value);
			stringify::to_upper(result);
			return result;
		}

		deposit_monitor::deposit_monitor(const protocol& params, const chain_descriptor& new_chain, const ledger::watched_address& new_target, warden::transaction_fetcher& new_fetcher, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster, scheduler& new_timers) noexcept : chain(new_chain), target(new_target), fetcher(new_fetcher), ledger(new_ledger), broadcaster(new_broadcaster), timers(new_timers), timer(INVALID_TASK_ID), consecutive_errors(0), next_delay(0), cycles(0), active(false), polling(false), stopped_by_failure(false), resume_pending(false), released(false)
		{
			auto& monitor = params.user.monitor;
			options.polling_interval = monitor.polling_interval;
			options.max_backoff = monitor.max_backoff;
			options.max_consecutive_errors = std::max<uint64_t>(1, monitor.max_consecutive_errors);
			options.required_confirmations = monitor.required_confirmations;
			options.logging = monitor.logging;
		}
		deposit_monitor::~deposit_monitor()
		{
			stop();
		}
		bool deposit_monitor::start()
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (active)
				return false;

			token = cancellation_token();
			active = true;
			stopped_by_failure = false;
			next_delay = 0;
			if (options.logging)
				VI_INFO("[monitor] %s deposit monitoring started for %s", chain.id.c_str(), target.address.c_str());

			if (polling)
				resume_pending = true;
			else
				schedule_next(token, 0);
			return true;
		}
		bool deposit_monitor::stop()
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (!active)
				return false;

			active = false;
			resume_pending = false;
			token.cancel();
			if (timer != INVALID_TASK_ID)
			{
				timers.cancel(timer);
				timer = INVALID_TASK_ID;
			}

			if (options.logging)
				VI_INFO("[monitor] %s deposit monitoring stopped for %s", chain.id.c_str(), target.address.c_str());
			return true;
		}
		bool deposit_monitor::restart()
		{
			umutex<std::recursive_mutex> unique(mutex);
			stop();
			consecutive_errors = 0;
			return start();
		}
		bool deposit_monitor::release_when_idle()
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (!polling)
				return false;

			released = true;
			return true;
		}
		monitor_state deposit_monitor::state()
		{
			umutex<std::recursive_mutex> unique(mutex);
			monitor_state result;
			result.active = active;
			result.polling = polling;
			result.stopped_by_failure = stopped_by_failure;
			result.consecutive_errors = consecutive_errors;
			result.next_delay = next_delay;
			result.cycles = cycles;
			result.processed = processed_hashes.size();
			return result;
		}
		uint64_t deposit_monitor::get_required_confirmations() const
		{
			return chain.required_confirmations > 0 ? chain.required_confirmations : options.required_confirmations;
		}
		uint64_t deposit_monitor::get_backoff_delay(uint64_t errors) const
		{
			if (!errors)
				return options.polling_interval;

			uint64_t delay = options.polling_interval;
			for (uint64_t i = 1; i < errors && delay < options.max_backoff; i++)
				delay *= 2;
			return std::min(delay, options.max_backoff);
		}
		const ledger::watched_address& deposit_monitor::get_target() const
		{
			return target;
		}
		const chain_descriptor& deposit_monitor::get_chain() const
		{
			return chain;
		}
		void deposit_monitor::begin_cycle(const cancellation_token& cycle_token)
		{
			{
				umutex<std::recursive_mutex> unique(mutex);
				timer = INVALID_TASK_ID;
				if (!active || cycle_token.is_cancelled())
					return;
				else if (polling)
				{
					resume_pending = true;
					return;
				}

				polling = true;
				++cycles;
			}

			poll(cycle_token).when([this]()
			{
				if (complete_cycle())
					memory::deinit(this);
			});
		}
		bool deposit_monitor::complete_cycle()
		{
			umutex<std::recursive_mutex> unique(mutex);
			polling = false;
			if (released)
				return true;

			if (active && resume_pending)
			{
				resume_pending = false;
				schedule_next(token, 0);
			}
			return false;
		}
		promise<void> deposit_monitor::poll(cancellation_token cycle_token)
		{
			auto status = coawait(process_cycle(cycle_token));
			if (!active || cycle_token.is_cancelled())
				coreturn_void;

			if (status)
			{
				consecutive_errors = 0;
				schedule_next(cycle_token, options.polling_interval);
				coreturn_void;
			}
			else if (status.error().is_shutdown())
			{
				if (options.logging)
					VI_INFO("[monitor] %s transport of %s is shut down", chain.id.c_str(), target.address.c_str());
				stop();
				coreturn_void;
			}
			else if (status.error().is_retry())
			{
				schedule_next(cycle_token, options.polling_interval);
				coreturn_void;
			}

			uint64_t errors = ++consecutive_errors;
			VI_ERR("[monitor] %s error in polling cycle for %s (attempt %i/%i): %s", chain.id.c_str(), target.address.c_str(), (int)errors, (int)options.max_consecutive_errors, status.what().c_str());
			if (errors >= options.max_consecutive_errors)
			{
				fail_stop(status.what());
				coreturn_void;
			}

			schedule_next(cycle_token, get_backoff_delay(errors));
			coreturn_void;
		}
		expects_promise_rt<void> deposit_monitor::process_cycle(cancellation_token cycle_token)
		{
			auto transactions = coawait(fetcher.fetch(target.address, warden::fetch_policy::fresh));
			if (!transactions)
				coreturn expects_rt<void>(std::move(transactions.error()));
			else if (!active || cycle_token.is_cancelled())
				coreturn expects_rt<void>(expectation::met);

			if (options.logging)
				VI_DEBUG("[monitor] %s found %i transactions for %s", chain.id.c_str(), (int)transactions->size(), target.address.c_str());

			uint64_t required = get_required_confirmations();
			for (auto& item : *transactions)
			{
				if (!active || cycle_token.is_cancelled())
					break;
				else if (item.direction == warden::transfer_direction::outgoing || item.hash.empty())
					continue;
				else if (is_processed(item.hash))
					continue;

				auto existing = ledger.find_transaction(item.hash, target.wallet_id);
				if (!existing)
					coreturn expects_rt<void>(remote_exception(stringify::text("transaction lookup failed: %s", existing.what().c_str())));
				else if (*existing)
				{
					mark_processed(item.hash);
					continue;
				}

				if (item.confirmations < required)
				{
					process_pending(item, required);
					continue;
				}

				auto status = coawait(process_confirmed(item, required, cycle_token));
				if (!status)
					VI_ERR("[monitor] %s failed to process confirmed transaction %s: %s", chain.id.c_str(), item.hash.c_str(), status.what().c_str());
			}

			coreturn expects_rt<void>(expectation::met);
		}
		expects_promise_lr<void> deposit_monitor::process_confirmed(warden::observed_transaction item, uint64_t required, cancellation_token cycle_token)
		{
			auto detail = coawait(fetcher.get_detail(item));
			if (!detail)
				coreturn expects_lr<void>(layer_exception(stringify::text("transaction detail failed: %s", detail.what().c_str())));
			else if (!active || cycle_token.is_cancelled())
				coreturn expects_lr<void>(expectation::met);

			decimal amount = detail->paid_to(target.address);
			if (amount.is_zero() || amount.is_nan())
				amount = item.value;

			uptr<schema> payload = var::set::object();
			payload->set("walletId", var::string(target.wallet_id));
			payload->set("chain", var::string(chain.id));
			payload->set("hash", var::string(item.hash));
			payload->set("type", var::string("DEPOSIT"));
			auto* from = payload->set("from", var::set::array());
			for (auto& address : detail->senders())
				from->push(var::string(address));
			auto* to = payload->set("to", var::set::array());
			for (auto& address : detail->receivers())
				to->push(var::string(address));
			payload->set("amount", var::string(amount.to_string()));
			payload->set("fee", var::string("0"));
			payload->set("status", var::string("CONFIRMED"));
			payload->set("confirmations", var::integer(std::max(item.confirmations, detail->confirmations)));
			payload->set("requiredConfirmations", var::integer(required));
			payload->set("timestamp", var::integer(item.block_time > 0 ? item.block_time : ledger::ledger_util::timestamp()));
			auto serialized = detail->as_schema();
			payload->set("inputs", serialized->get("inputs")->copy());
			payload->set("outputs", serialized->get("outputs")->copy());

			ledger::persisted_transaction record;
			record.id = ledger::ledger_util::generate_id();
			record.hash = item.hash;
			record.wallet_id = target.wallet_id;
			record.chain = chain.id;
			record.currency = chain.currency;
			record.address = target.address;
			record.type = ledger::transaction_type::deposit;
			record.status = ledger::transaction_status::confirmed;
			record.amount = amount;
			record.fee = decimal::zero();
			record.metadata = payload->copy();
			record.created_at = ledger::ledger_util::timestamp();

			auto credited = ledger.credit_deposit(record);
			if (!credited)
				coreturn expects_lr<void>(std::move(credited.error()));

			mark_processed(item.hash);
			if (*credited)
			{
				broadcaster.publish(events::topics::deposit_confirmed(), *payload);
				if (options.logging)
					VI_INFO("[monitor] %s deposit %s of %s %s credited to wallet %s", chain.id.c_str(), item.hash.c_str(), amount.to_string().c_str(), chain.currency.c_str(), target.wallet_id.c_str());
			}
			coreturn expects_lr<void>(expectation::met);
		}
		void deposit_monitor::process_pending(const warden::observed_transaction& item, uint64_t required)
		{
			{
				umutex<std::recursive_mutex> unique(mutex);
				auto it = last_broadcast_confirmations.find(item.hash);
				if (it != last_broadcast_confirmations.end() && it->second == item.confirmations)
					return;
				last_broadcast_confirmations[item.hash] = item.confirmations;
			}

			uptr<schema> payload = var::set::object();
			payload->set("walletId", var::string(target.wallet_id));
			payload->set("chain", var::string(chain.id));
			payload->set("hash", var::string(item.hash));
			payload->set("transactionHash", var::string(item.hash));
			payload->set("type", var::string("pending_confirmation"));
			payload->set("from", var::string("N/A"));
			payload->set("address", var::string(target.address));
			payload->set("amount", var::string(item.value.to_string()));
			payload->set("fee", var::integer(0));
			payload->set("confirmations", var::integer(item.confirmations));
			payload->set("requiredConfirmations", var::integer(required));
			payload->set("status", var::string("PENDING"));
			broadcaster.publish(events::topics::deposit_pending(), *payload);
			if (options.logging)
				VI_DEBUG("[monitor] %s transaction %s pending (%i/%i confirmations)", chain.id.c_str(), item.hash.c_str(), (int)item.confirmations, (int)required);
		}
		void deposit_monitor::schedule_next(const cancellation_token& cycle_token, uint64_t delay)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (!active || cycle_token.is_cancelled())
				return;

			next_delay = delay;
			timer = timers.schedule(delay, [this, cycle_token]()
			{
				begin_cycle(cycle_token);
			}, cycle_token);
		}
		void deposit_monitor::fail_stop(const std::string_view& reason)
		{
			uint64_t errors = consecutive_errors;
			{
				umutex<std::recursive_mutex> unique(mutex);
				stop();
				stopped_by_failure = true;
			}

			VI_ERR("[monitor] %s max consecutive errors reached for %s, monitor stopped", chain.id.c_str(), target.address.c_str());
			uptr<schema> payload = var::set::object();
			payload->set("walletId", var::string(target.wallet_id));
			payload->set("chain", var::string(chain.id));
			payload->set("address", var::string(target.address));
			payload->set("consecutiveErrors", var::integer(errors));
			payload->set("reason", var::string(reason));
			broadcaster.publish(events::topics::monitor_stopped(), *payload);
		}
		bool deposit_monitor::is_processed(const string& hash)
		{
			umutex<std::recursive_mutex> unique(mutex);
			return processed_hashes.find(hash) != processed_hashes.end();
		}
		void deposit_monitor::mark_processed(const string& hash)
		{
			umutex<std::recursive_mutex> unique(mutex);
			processed_hashes.insert(hash);
			last_broadcast_confirmations.erase(hash);
		}

		monitor_supervisor::monitor_supervisor(const protocol& new_params, const chain_registry& new_registry, warden::fetcher_set& new_fetchers, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster, scheduler& new_timers) noexcept : params(new_params), registry(new_registry), fetchers(new_fetchers), ledger(new_ledger), broadcaster(new_broadcaster), timers(new_timers)
		{
		}
		monitor_supervisor::~monitor_supervisor()
		{
			umutex<std::recursive_mutex> unique(mutex);
			for (auto& item : monitors)
				retire(std::move(item.second));
			monitors.clear();
		}
		void monitor_supervisor::assign_node(const std::string_view& chain, warden::node_client* node)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (node != nullptr)
				nodes[upper_of(chain)] = node;
			else
				nodes.erase(upper_of(chain));
		}
		expects_promise_lr<void> monitor_supervisor::watch(const ledger::watched_address& target)
		{
			ledger::watched_address address = target;
			auto chain = registry.get_chain(address.chain);
			if (!chain)
				coreturn expects_lr<void>(std::move(chain.error()));

			auto fetcher = fetchers.get_fetcher((*chain)->id);
			if (!fetcher)
				coreturn expects_lr<void>(std::move(fetcher.error()));

			address.chain = (*chain)->id;
			string key = key_of(address.chain, address.address);
			{
				umutex<std::recursive_mutex> unique(mutex);
				if (monitors.find(key) != monitors.end())
					coreturn expects_lr<void>(expectation::met);
			}

			auto* node = (*chain)->family == chain_family::utxo ? get_node(address.chain) : nullptr;
			if (node != nullptr)
			{
				bool rescan = (*chain)->transport.rescan_on_watch;
				auto status = coawait(node->import_watch_address(address.address, "custody:" + address.wallet_id, rescan));
				if (!status)
					coreturn expects_lr<void>(layer_exception(stringify::text("watch-only import of %s failed: %s", address.address.c_str(), status.what().c_str())));
			}

			umutex<std::recursive_mutex> unique(mutex);
			auto it = monitors.find(key);
			if (it == monitors.end())
			{
				uptr<deposit_monitor> monitor = memory::init<deposit_monitor>(params, **chain, address, **fetcher, ledger, broadcaster, timers);
				monitor->start();
				monitors[key] = std::move(monitor);
			}
			coreturn expects_lr<void>(expectation::met);
		}
		promise<size_t> monitor_supervisor::watch_all(vector<ledger::watched_address>&& targets)
		{
			vector<ledger::watched_address> addresses = std::move(targets);
			size_t watched = 0;
			for (auto& address : addresses)
			{
				auto status = coawait(watch(address));
				if (status)
					++watched;
				else
					VI_ERR("[monitor] %s cannot watch %s: %s", address.chain.c_str(), address.address.c_str(), status.what().c_str());
			}
			coreturn watched;
		}
		bool monitor_supervisor::unwatch(const std::string_view& chain, const std::string_view& address)
		{
			uptr<deposit_monitor> monitor;
			{
				umutex<std::recursive_mutex> unique(mutex);
				auto it = monitors.find(key_of(chain, address));
				if (it == monitors.end())
					return false;

				monitor = std::move(it->second);
				monitors.erase(it);
			}
			retire(std::move(monitor));
			return true;
		}
		expects_lr<void> monitor_supervisor::restart(const std::string_view& chain, const std::string_view& address)
		{
			umutex<std::recursive_mutex> unique(mutex);
			auto it = monitors.find(key_of(chain, address));
			if (it == monitors.end())
				return layer_exception(stringify::text("monitor not found: %s", key_of(chain, address).c_str()));

			it->second->restart();
			return expectation::met;
		}
		expects_promise_lr<void> monitor_supervisor::rescan(const std::string_view& chain, uint64_t start_height)
		{
			auto* node = get_node(chain);
			if (!node)
				coreturn expects_lr<void>(layer_exception::unsupported_chain(chain));

			auto status = coawait(node->rescan(start_height));
			if (!status)
				coreturn expects_lr<void>(layer_exception(stringify::text("rescan failed: %s", status.what().c_str())));

			coreturn expects_lr<void>(expectation::met);
		}
		size_t monitor_supervisor::stop_all()
		{
			umutex<std::recursive_mutex> unique(mutex);
			size_t stopped = 0;
			for (auto& item : monitors)
			{
				if (item.second->stop())
					++stopped;
			}
			return stopped;
		}
		vector<string> monitor_supervisor::get_stopped()
		{
			umutex<std::recursive_mutex> unique(mutex);
			vector<string> result;
			for (auto& item : monitors)
			{
				if (!item.second->state().active)
					result.push_back(item.first);
			}
			std::sort(result.begin(), result.end());
			return result;
		}
		deposit_monitor* monitor_supervisor::get_monitor(const std::string_view& chain, const std::string_view& address)
		{
			umutex<std::recursive_mutex> unique(mutex);
			auto it = monitors.find(key_of(chain, address));
			return it != monitors.end() ? *it->second : nullptr;
		}
		size_t monitor_supervisor::size()
		{
			umutex<std::recursive_mutex> unique(mutex);
			return monitors.size();
		}
		string monitor_supervisor::key_of(const std::string_view& chain, const std::string_view& address)
		{
			return upper_of(chain) + ":" + string(address);
		}
		warden::node_client* monitor_supervisor::get_node(const std::string_view& chain)
		{
			umutex<std::recursive_mutex> unique(mutex);
			auto it = nodes.find(upper_of(chain));
			return it != nodes.end() ? it->second : nullptr;
		}
		void monitor_supervisor::retire(uptr<deposit_monitor>&& monitor)
		{
			/* a cycle in flight takes ownership and releases the monitor once it settles */
			monitor->stop();
			if (monitor->release_when_idle())
				monitor.reset();
		}
	}
}
