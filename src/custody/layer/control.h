#ifndef CST_LAYER_CONTROL_H
#define CST_LAYER_CONTROL_H
#include "../kernel/chain.h"

namespace custody
{
	class cancellation_token
	{
	private:
		std::shared_ptr<std::atomic<bool>> state;

	public:
		cancellation_token();
		void cancel() const noexcept;
		bool is_cancelled() const noexcept;
	};

	class scheduler
	{
	public:
		virtual ~scheduler() = default;
		virtual task_id schedule(uint64_t delay_ms, task_callback&& callback, const cancellation_token& token) = 0;
		virtual bool cancel(task_id id) = 0;
		virtual uint64_t now() const = 0;
	};

	class timer_scheduler final : public scheduler
	{
	private:
		unordered_map<task_id, task_id> timers;
		std::recursive_mutex sync;
		std::atomic<bool> active;
		task_id counter;
		string service_name;
		bool logging;

	public:
		timer_scheduler(const std::string_view& label, bool control_logging) noexcept;
		~timer_scheduler() override;
		task_id schedule(uint64_t delay_ms, task_callback&& callback, const cancellation_token& token) override;
		bool cancel(task_id id) override;
		uint64_t now() const override;
		bool activate() noexcept;
		bool deactivate() noexcept;
		bool is_active() const noexcept;
		size_t size() noexcept;

	private:
		bool forget(task_id id) noexcept;
	};

	class manual_scheduler final : public scheduler
	{
	private:
		struct entry
		{
			task_id id;
			uint64_t due;
			task_callback callback;
			cancellation_token token;
		};

	private:
		vector<entry> queue;
		vector<uint64_t> delays;
		std::recursive_mutex sync;
		uint64_t clock;
		task_id counter;

	public:
		manual_scheduler(uint64_t start_time = 0) noexcept;
		task_id schedule(uint64_t delay_ms, task_callback&& callback, const cancellation_token& token) override;
		bool cancel(task_id id) override;
		uint64_t now() const override;
		bool step();
		size_t run(size_t steps);
		size_t advance(uint64_t ms);
		size_t pending();
		vector<uint64_t> get_delays();
	};

	struct service_control
	{
	public:
		struct service_node
		{
			std::function<void()> startup;
			std::function<void()> shutdown;
		};

	private:
		static service_control* instance;

	private:
		vector<service_node> services;
		std::atomic<int> exit_code;
		bool logging;

	public:
		service_control(bool control_logging) noexcept;
		~service_control() noexcept;
		void bind(service_node&& entrypoint) noexcept;
		void shutdown(int signal) noexcept;
		void abort(int signal) noexcept;
		int launch() noexcept;

	private:
		template <signal_code type>
		static void bind_normal_termination()
		{
			os::process::bind_signal(type, [](int signal)
			{
				os::process::rebind_signal(type);
				if (instance != nullptr)
					instance->shutdown(signal);
			});
		}
		template <signal_code type>
		static void bind_fatal_termination()
		{
			os::process::bind_signal(type, [](int signal)
			{
				os::process::rebind_signal(type);
				if (instance != nullptr)
					instance->abort(signal);
			});
		}
	};
}
#endif
