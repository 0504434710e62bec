#include "broadcaster.h"

namespace custody
{
	namespace events
	{
		const char* topics::any()
		{
			return "*";
		}
		const char* topics::deposit_pending()
		{
			return "deposit.pending";
		}
		const char* topics::deposit_confirmed()
		{
			return "deposit.confirmed";
		}
		const char* topics::monitor_stopped()
		{
			return "monitor.stopped";
		}
		const char* topics::withdrawal_pending()
		{
			return "withdrawal.pending";
		}
		const char* topics::withdrawal_broadcast()
		{
			return "withdrawal.broadcast";
		}
		const char* topics::withdrawal_rejected()
		{
			return "withdrawal.rejected";
		}
		const char* topics::transfer_completed()
		{
			return "transfer.completed";
		}

		event_broadcaster::event_broadcaster(bool new_logging) noexcept : published(0), failures(0), counter(0), logging(new_logging)
		{
		}
		uint64_t event_broadcaster::subscribe(const std::string_view& topic, const std::string_view& name, event_callback&& callback)
		{
			VI_ASSERT(callback != nullptr, "callback should be set");
			umutex<std::recursive_mutex> unique(mutex);
			subscriber item;
			item.id = ++counter;
			item.topic = topic;
			item.name = name;
			item.callback = std::move(callback);
			subscribers.emplace_back(std::move(item));
			return counter;
		}
		bool event_broadcaster::unsubscribe(uint64_t id)
		{
			umutex<std::recursive_mutex> unique(mutex);
			for (auto it = subscribers.begin(); it != subscribers.end(); it++)
			{
				if (it->id == id)
				{
					subscribers.erase(it);
					return true;
				}
			}
			return false;
		}
		size_t event_broadcaster::publish(const std::string_view& topic, schema* payload)
		{
			vector<subscriber> targets;
			{
				umutex<std::recursive_mutex> unique(mutex);
				for (auto& item : subscribers)
				{
					if (item.topic == topic || item.topic == topics::any())
						targets.push_back(item);
				}
			}

			++published;
			size_t delivered = 0;
			for (auto& item : targets)
			{
				uptr<schema> copy = payload ? payload->copy() : var::set::null();
				auto status = item.callback(topic, std::move(copy));
				if (!status)
				{
					++failures;
					VI_ERR("[events] subscriber %s failed on %.*s: %s", item.name.c_str(), (int)topic.size(), topic.data(), status.what().c_str());
					continue;
				}
				++delivered;
			}

			if (logging)
				VI_DEBUG("[events] %.*s delivered to %i of %i subscribers", (int)topic.size(), topic.data(), (int)delivered, (int)targets.size());
			return delivered;
		}
		size_t event_broadcaster::size()
		{
			umutex<std::recursive_mutex> unique(mutex);
			return subscribers.size();
		}
		uint64_t event_broadcaster::get_published() const
		{
			return published;
		}
		uint64_t event_broadcaster::get_failures() const
		{
			return failures;
		}
	}
}
