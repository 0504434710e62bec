#ifndef CST_SERVICE_BROADCASTER_H
#define CST_SERVICE_BROADCASTER_H
#include "../kernel/chain.h"

namespace custody
{
	namespace events
	{
		typedef std::function<expects_lr<void>(const std::string_view&, uptr<schema>&&)> event_callback;

		class topics
		{
		public:
			static const char* any();
			static const char* deposit_pending();
			static const char* deposit_confirmed();
			static const char* monitor_stopped();
			static const char* withdrawal_pending();
			static const char* withdrawal_broadcast();
			static const char* withdrawal_rejected();
			static const char* transfer_completed();
		};

		class event_broadcaster
		{
		private:
			struct subscriber
			{
				uint64_t id;
				string topic;
				string name;
				event_callback callback;
			};

		private:
			vector<subscriber> subscribers;
			std::recursive_mutex mutex;
			std::atomic<uint64_t> published;
			std::atomic<uint64_t> failures;
			uint64_t counter;
			bool logging;

		public:
			event_broadcaster(bool new_logging = false) noexcept;
			event_broadcaster(const event_broadcaster&) = delete;
			event_broadcaster& operator=(const event_broadcaster&) = delete;
			uint64_t subscribe(const std::string_view& topic, const std::string_view& name, event_callback&& callback);
			bool unsubscribe(uint64_t id);
			size_t publish(const std::string_view& topic, schema* payload);
			size_t size();
			uint64_t get_published() const;
			uint64_t get_failures() const;
		};
	}
}
#endif
