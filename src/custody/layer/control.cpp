#include "control.h"
#include <iostream>

namespace custody
{
	cancellation_token::cancellation_token() : state(std::make_shared<std::atomic<bool>>(false))
	{
	}
	void cancellation_token::cancel() const noexcept
	{
		*state = true;
	}
	bool cancellation_token::is_cancelled() const noexcept
	{
		return *state;
	}

	timer_scheduler::timer_scheduler(const std::string_view& label, bool control_logging) noexcept : active(false), counter(0), service_name(label.empty() ? "unknown" : label), logging(control_logging)
	{
	}
	timer_scheduler::~timer_scheduler()
	{
		deactivate();
	}
	task_id timer_scheduler::schedule(uint64_t delay_ms, task_callback&& callback, const cancellation_token& token)
	{
		umutex<std::recursive_mutex> unique(sync);
		if (!active || token.is_cancelled())
		{
			if (logging)
				VI_INFO("cancel timeout on %s service: %s", service_name.c_str(), active ? "cancelled" : "shutdown");
			return INVALID_TASK_ID;
		}

		task_id id = ++counter;
		task_id timer = schedule::get()->set_timeout(delay_ms, [this, id, token, callback = std::move(callback)]() mutable
		{
			if (!forget(id) || token.is_cancelled())
				return;

			callback();
		});
		if (timer == INVALID_TASK_ID)
		{
			if (logging)
				VI_INFO("cancel timeout on %s service: inactive", service_name.c_str());
			return INVALID_TASK_ID;
		}

		if (logging)
			VI_INFO("OK spawn task on %s service (mode: timeout, delay: %" PRIu64 " ms)", service_name.c_str(), delay_ms);
		timers[id] = timer;
		return id;
	}
	bool timer_scheduler::cancel(task_id id)
	{
		umutex<std::recursive_mutex> unique(sync);
		auto it = timers.find(id);
		if (it == timers.end())
			return false;

		schedule::get()->clear_timeout(it->second);
		timers.erase(it);
		return true;
	}
	uint64_t timer_scheduler::now() const
	{
		return date_time().milliseconds();
	}
	bool timer_scheduler::activate() noexcept
	{
		umutex<std::recursive_mutex> unique(sync);
		if (active)
			return false;

		active = true;
		return true;
	}
	bool timer_scheduler::deactivate() noexcept
	{
		umutex<std::recursive_mutex> unique(sync);
		if (!active)
			return false;

		active = false;
		auto* queue = schedule::get();
		for (auto& [id, timer] : timers)
			queue->clear_timeout(timer);
		if (logging && !timers.empty())
			VI_INFO("OK clear timers on %s service (timers: %" PRIu64 ")", service_name.c_str(), (uint64_t)timers.size());
		timers.clear();
		return true;
	}
	bool timer_scheduler::is_active() const noexcept
	{
		return active;
	}
	size_t timer_scheduler::size() noexcept
	{
		umutex<std::recursive_mutex> unique(sync);
		return timers.size();
	}
	bool timer_scheduler::forget(task_id id) noexcept
	{
		umutex<std::recursive_mutex> unique(sync);
		if (!active)
			return false;

		return timers.erase(id) > 0;
	}

	manual_scheduler::manual_scheduler(uint64_t start_time) noexcept : clock(start_time), counter(0)
	{
	}
	task_id manual_scheduler::schedule(uint64_t delay_ms, task_callback&& callback, const cancellation_token& token)
	{
		umutex<std::recursive_mutex> unique(sync);
		if (token.is_cancelled())
			return INVALID_TASK_ID;

		entry item;
		item.id = ++counter;
		item.due = clock + delay_ms;
		item.callback = std::move(callback);
		item.token = token;
		queue.push_back(std::move(item));
		delays.push_back(delay_ms);
		return counter;
	}
	bool manual_scheduler::cancel(task_id id)
	{
		umutex<std::recursive_mutex> unique(sync);
		auto it = std::find_if(queue.begin(), queue.end(), [id](const entry& item) { return item.id == id; });
		if (it == queue.end())
			return false;

		queue.erase(it);
		return true;
	}
	uint64_t manual_scheduler::now() const
	{
		return clock;
	}
	bool manual_scheduler::step()
	{
		while (true)
		{
			umutex<std::recursive_mutex> unique(sync);
			if (queue.empty())
				return false;

			auto next = std::min_element(queue.begin(), queue.end(), [](const entry& a, const entry& b) { return a.due < b.due || (a.due == b.due && a.id < b.id); });
			entry item = std::move(*next);
			queue.erase(next);
			clock = std::max(clock, item.due);
			if (item.token.is_cancelled())
				continue;

			unique.unlock();
			item.callback();
			return true;
		}
	}
	size_t manual_scheduler::run(size_t steps)
	{
		size_t executed = 0;
		while (executed < steps && step())
			++executed;
		return executed;
	}
	size_t manual_scheduler::advance(uint64_t ms)
	{
		size_t executed = 0;
		uint64_t target = clock + ms;
		while (true)
		{
			umutex<std::recursive_mutex> unique(sync);
			auto next = std::min_element(queue.begin(), queue.end(), [](const entry& a, const entry& b) { return a.due < b.due || (a.due == b.due && a.id < b.id); });
			if (next == queue.end() || next->due > target)
				break;

			unique.unlock();
			if (step())
				++executed;
		}

		umutex<std::recursive_mutex> unique(sync);
		clock = std::max(clock, target);
		return executed;
	}
	size_t manual_scheduler::pending()
	{
		umutex<std::recursive_mutex> unique(sync);
		return (size_t)std::count_if(queue.begin(), queue.end(), [](const entry& item) { return !item.token.is_cancelled(); });
	}
	vector<uint64_t> manual_scheduler::get_delays()
	{
		umutex<std::recursive_mutex> unique(sync);
		return delays;
	}

	service_control::service_control(bool control_logging) noexcept : exit_code(0xFFFFFFFF), logging(control_logging)
	{
		instance = this;
		bind_fatal_termination<signal_code::SIG_ABRT>();
		bind_fatal_termination<signal_code::SIG_FPE>();
		bind_fatal_termination<signal_code::SIG_ILL>();
		bind_fatal_termination<signal_code::SIG_SEGV>();
		bind_normal_termination<signal_code::SIG_INT>();
		bind_normal_termination<signal_code::SIG_TERM>();
	}
	service_control::~service_control() noexcept
	{
		if (instance == this)
			instance = nullptr;
	}
	void service_control::bind(service_node&& entrypoint) noexcept
	{
		if (entrypoint.startup && entrypoint.shutdown)
			services.push_back(std::move(entrypoint));
	}
	void service_control::shutdown(int signal) noexcept
	{
		if (logging)
			VI_INFO("service shutdown (signal code: %i, state = OK)", signal);

		instance = nullptr;
		if (signal != os::process::get_signal_id(signal_code::SIG_INT) && signal != os::process::get_signal_id(signal_code::SIG_TERM))
			exit_code = 0x1;
		else
			exit_code = 0x0;
		schedule::get()->wakeup();
	}
	void service_control::abort(int signal) noexcept
	{
		std::cout << "[srvctl] PANIC! service termination (signal code " << signal << ", state = unrecoverable, mode: abort):\n" << error_handling::get_stack_trace(0) << std::endl;
		instance = nullptr;
		os::process::abort();
	}
	int service_control::launch() noexcept
	{
		schedule::desc policy;
		policy.ping = [this]() { return exit_code == 0xFFFFFFFF; };
		if (logging)
			VI_INFO("service launch (services: %i)", (int)services.size());

		for (auto& service : services)
			service.startup();

		error_handling::set_flag(log_option::async, true);
		schedule* queue = schedule::get();
		if (!queue->start(policy))
			return -1;

		error_handling::set_flag(log_option::async, false);
		for (auto& service : services)
			service.shutdown();

		queue->stop();
		if (multiplexer::has_instance())
			multiplexer::get()->shutdown();

		while (queue->dispatch());
		return exit_code == (int)0xFFFFFFFF ? 0 : (int)exit_code;
	}
	service_control* service_control::instance = nullptr;
}
