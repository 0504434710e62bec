#ifndef CST_SERVICE_MONITOR_H
#define CST_SERVICE_MONITOR_H
#include "broadcaster.h"
#include "../kernel/warden.h"
#include "../policy/ledger.h"

namespace custody
{
	namespace deposits
	{
		struct monitor_state
		{
			bool active = false;
			bool polling = false;
			bool stopped_by_failure = false;
			uint64_t consecutive_errors = 0;
			uint64_t next_delay = 0;
			uint64_t cycles = 0;
			size_t processed = 0;
		};

		class deposit_monitor
		{
		private:
			struct
			{
				uint64_t polling_interval;
				uint64_t max_backoff;
				uint64_t max_consecutive_errors;
				uint64_t required_confirmations;
				bool logging;
			} options;

		private:
			const chain_descriptor& chain;
			ledger::watched_address target;
			warden::transaction_fetcher& fetcher;
			ledger::ledger_gateway& ledger;
			events::event_broadcaster& broadcaster;
			scheduler& timers;
			unordered_set<string> processed_hashes;
			unordered_map<string, uint64_t> last_broadcast_confirmations;
			cancellation_token token;
			std::recursive_mutex mutex;
			task_id timer;
			std::atomic<uint64_t> consecutive_errors;
			std::atomic<uint64_t> next_delay;
			std::atomic<uint64_t> cycles;
			std::atomic<bool> active;
			std::atomic<bool> polling;
			std::atomic<bool> stopped_by_failure;
			bool resume_pending;
			bool released;

		public:
			deposit_monitor(const protocol& params, const chain_descriptor& new_chain, const ledger::watched_address& new_target, warden::transaction_fetcher& new_fetcher, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster, scheduler& new_timers) noexcept;
			deposit_monitor(const deposit_monitor&) = delete;
			~deposit_monitor();
			deposit_monitor& operator=(const deposit_monitor&) = delete;
			bool start();
			bool stop();
			bool restart();
			bool release_when_idle();
			monitor_state state();
			uint64_t get_required_confirmations() const;
			uint64_t get_backoff_delay(uint64_t errors) const;
			const ledger::watched_address& get_target() const;
			const chain_descriptor& get_chain() const;

		private:
			void begin_cycle(const cancellation_token& cycle_token);
			bool complete_cycle();
			promise<void> poll(cancellation_token cycle_token);
			expects_promise_rt<void> process_cycle(cancellation_token cycle_token);
			expects_promise_lr<void> process_confirmed(warden::observed_transaction item, uint64_t required, cancellation_token cycle_token);
			void process_pending(const warden::observed_transaction& item, uint64_t required);
			void schedule_next(const cancellation_token& cycle_token, uint64_t delay);
			void fail_stop(const std::string_view& reason);
			bool is_processed(const string& hash);
			void mark_processed(const string& hash);
		};

		class monitor_supervisor
		{
		private:
			const protocol& params;
			const chain_registry& registry;
			warden::fetcher_set& fetchers;
			ledger::ledger_gateway& ledger;
			events::event_broadcaster& broadcaster;
			scheduler& timers;
			unordered_map<string, warden::node_client*> nodes;
			unordered_map<string, uptr<deposit_monitor>> monitors;
			std::recursive_mutex mutex;

		public:
			monitor_supervisor(const protocol& new_params, const chain_registry& new_registry, warden::fetcher_set& new_fetchers, ledger::ledger_gateway& new_ledger, events::event_broadcaster& new_broadcaster, scheduler& new_timers) noexcept;
			monitor_supervisor(const monitor_supervisor&) = delete;
			~monitor_supervisor();
			monitor_supervisor& operator=(const monitor_supervisor&) = delete;
			void assign_node(const std::string_view& chain, warden::node_client* node);
			expects_promise_lr<void> watch(const ledger::watched_address& target);
			promise<size_t> watch_all(vector<ledger::watched_address>&& targets);
			bool unwatch(const std::string_view& chain, const std::string_view& address);
			expects_lr<void> restart(const std::string_view& chain, const std::string_view& address);
			expects_promise_lr<void> rescan(const std::string_view& chain, uint64_t start_height);
			size_t stop_all();
			vector<string> get_stopped();
			deposit_monitor* get_monitor(const std::string_view& chain, const std::string_view& address);
			size_t size();

		public:
			static string key_of(const std::string_view& chain, const std::string_view& address);

		private:
			warden::node_client* get_node(const std::string_view& chain);
			static void retire(uptr<deposit_monitor>&& monitor);
		};
	}
}
#endif
