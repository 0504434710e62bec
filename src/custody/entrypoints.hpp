#ifndef CST_ENTRYPOINTS_HPP
#define CST_ENTRYPOINTS_HPP
#include "backend/explorer.h"
#include "backend/service.h"
#include "backend/utxo.h"
#include "service/monitor.h"
#include "service/settlement.h"
#include "storage/cachestate.h"
#include "storage/ledgerstate.h"

namespace custody
{
	namespace entrypoints
	{
		struct chain_transports
		{
			vector<uptr<warden::server_relay>> relays;
			vector<uptr<warden::node_client>> nodes;
		};

		inline void assign_transports(const protocol& params, const chain_registry& registry, warden::http_channel* channel, scheduler* timers, storages::cachestate* cache, chain_transports& transports, warden::fetcher_set& fetchers, deposits::monitor_supervisor& supervisor, settlement::withdrawal_queue& withdrawals)
		{
			for (auto* chain : registry.get_chains())
			{
				auto& transport = chain->transport;
				switch (chain->backend)
				{
					case chain_backend::bitcoin_node:
					{
						uptr<warden::server_relay> relay = memory::init<warden::server_relay>(params, channel, timers, transport.node_url, transport.node_username, transport.node_password, transport.rps);
						uptr<warden::node_client> node = memory::init<warden::node_client>(*relay, *chain);
						fetchers.assign(*chain, uptr<warden::transaction_fetcher>(memory::init<warden::backends::utxo_fetcher>(*node, params.user.monitor.history_size)));
						if (chain->fees.dynamic_estimation)
							fetchers.assign(*chain, uptr<warden::fee_estimator>(memory::init<warden::backends::utxo_estimator>(*node)));
						supervisor.assign_node(chain->id, *node);
						withdrawals.assign_dispatcher(chain->id, uptr<settlement::withdrawal_dispatcher>(memory::init<settlement::node_dispatcher>(*node)));
						transports.nodes.push_back(std::move(node));
						transports.relays.push_back(std::move(relay));
						break;
					}
					case chain_backend::etherscan:
					{
						uptr<warden::server_relay> relay = memory::init<warden::server_relay>(params, channel, timers, std::string_view(), std::string_view(), std::string_view(), transport.rps);
						fetchers.assign(*chain, uptr<warden::transaction_fetcher>(memory::init<warden::backends::explorer_fetcher>(*relay, cache, *chain, params.user.explorer.cache_expiration, params.user.explorer.logging)));
						transports.relays.push_back(std::move(relay));
						break;
					}
					case chain_backend::trongrid:
					{
						uptr<warden::server_relay> relay = memory::init<warden::server_relay>(params, channel, timers, transport.node_url, transport.node_username, transport.node_password, transport.rps);
						fetchers.assign(*chain, uptr<warden::transaction_fetcher>(memory::init<warden::backends::tron_fetcher>(*relay, *chain)));
						fetchers.assign(*chain, uptr<warden::fee_estimator>(memory::init<warden::backends::tron_estimator>(*relay, *chain)));
						transports.relays.push_back(std::move(relay));
						break;
					}
					case chain_backend::monero_wallet:
					{
						uptr<warden::server_relay> relay = memory::init<warden::server_relay>(params, channel, timers, transport.node_url, transport.node_username, transport.node_password, transport.rps);
						fetchers.assign(*chain, uptr<warden::fee_estimator>(memory::init<warden::backends::monero_estimator>(*relay, *chain)));
						transports.relays.push_back(std::move(relay));
						break;
					}
					default:
						break;
				}
			}
		}

		int node(const inline_args& environment)
		{
			auto params = protocol(environment);
			auto registry = chain_registry(params);
			timer_scheduler timers = timer_scheduler("custody", params.user.logs.control_logging);
			warden::server_channel channel;
			storages::ledgerstate ledger = storages::ledgerstate(params.database);
			storages::cachestate cache = storages::cachestate(params.database);
			events::event_broadcaster broadcaster = events::event_broadcaster(params.user.monitor.logging);
			chain_transports transports;
			warden::fetcher_set fetchers;
			deposits::monitor_supervisor supervisor = deposits::monitor_supervisor(params, registry, fetchers, ledger, broadcaster, timers);
			settlement::fee_calculator calculator = settlement::fee_calculator(registry, &fetchers);
			settlement::withdrawal_queue withdrawals = settlement::withdrawal_queue(params, registry, calculator, ledger, broadcaster);
			assign_transports(params, registry, &channel, &timers, &cache, transports, fetchers, supervisor, withdrawals);

			broadcaster.subscribe(events::topics::any(), "journal", [&params](const std::string_view& topic, uptr<schema>&& payload) -> expects_lr<void>
			{
				if (params.user.logs.control_logging)
					VI_INFO("[event] %.*s: %s", (int)topic.size(), topic.data(), schema::to_json(*payload).c_str());
				return expectation::met;
			});

			cancellation_token token;
			std::function<void()> dispatch_withdrawals;
			dispatch_withdrawals = [&]()
			{
				withdrawals.dispatch().when([&](size_t&& broadcasted)
				{
					auto pruned = cache.prune_cache();
					if (!pruned)
						VI_ERR("[explorer] cache pruning failed: %s", pruned.what().c_str());
					if (params.user.settlement.logging && broadcasted > 0)
						VI_INFO("[settlement] dispatch cycle: %i withdrawals broadcast", (int)broadcasted);
					timers.schedule(params.user.monitor.polling_interval, [&]() { dispatch_withdrawals(); }, token);
				});
			};

			service_control::service_node entrypoint;
			entrypoint.startup = [&]()
			{
				timers.activate();
				channel.allow_activities();
				for (auto& relay : transports.relays)
					relay->allow_activities();

				auto addresses = ledger.get_addresses();
				if (!addresses)
					VI_ERR("[monitor] cannot load watched addresses: %s", addresses.what().c_str());
				else
				{
					supervisor.watch_all(std::move(*addresses)).when([&params](size_t&& watched)
					{
						if (params.user.monitor.logging)
							VI_INFO("[monitor] %i addresses are watched", (int)watched);
					});
				}
				timers.schedule(params.user.monitor.polling_interval, [&]() { dispatch_withdrawals(); }, token);
			};
			entrypoint.shutdown = [&]()
			{
				token.cancel();
				supervisor.stop_all();
				for (auto& relay : transports.relays)
					relay->cancel_activities();
				channel.cancel_activities();
				timers.deactivate();
				params.database.checkpoint();
				if (params.user.logs.control_logging)
					VI_INFO("[event] %" PRIu64 " events published, %" PRIu64 " subscriber failures", broadcaster.get_published(), broadcaster.get_failures());
			};

			service_control control = service_control(params.user.logs.control_logging);
			control.bind(std::move(entrypoint));
			return control.launch();
		}
	}
}
#endif
