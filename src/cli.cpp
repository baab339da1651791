#include "warden/cli.hpp"
#include "warden/config.hpp"
#include "warden/engine.hpp"
#include "warden/scheduler.hpp"
#include "warden/web_server.hpp"
#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <thread>
#include <vector>

namespace warden::cli
{
	namespace
	{
		Result<WardenConfig> load_config(const std::string &path)
		{
			return path.empty() ? ConfigLoader::from_env() : ConfigLoader::load(path);
		}

		int serve(WardenConfig cfg, std::size_t threads)
		{
			boost::asio::io_context ioc;
			auto clock = std::make_shared<SystemClock>();

			EngineDependencies deps;
			deps.clock = clock;
			deps.dispatch_executor = ioc.get_executor();

			auto engine = Engine::create(cfg, std::move(deps));
			if (!engine)
			{
				spdlog::critical("cannot start engine: {}", engine.error().what());
				return 1;
			}

			AsioScheduler scheduler(ioc);
			(*engine)->housekeeper().start(scheduler);

			WebServer server(ioc, **engine, cfg.server, clock);
			if (auto started = server.start(); !started)
			{
				spdlog::critical("{}", started.error().what());
				return 1;
			}
			server.start_maintenance(scheduler);

			boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
			signals.async_wait([&](const boost::system::error_code &ec, int signo)
							   {
				if (ec)
					return;
				spdlog::info("signal {} received, shutting down", signo);
				server.stop();
				scheduler.stop();
				ioc.stop(); });

			std::vector<std::thread> workers;
			workers.reserve(threads > 0 ? threads - 1 : 0);
			for (std::size_t i = 1; i < threads; ++i)
				workers.emplace_back([&ioc]
									 { ioc.run(); });
			ioc.run();
			for (auto &t : workers)
				t.join();
			return 0;
		}

		/**
		 * Feed a JSON-lines file of events through a fresh engine on virtual
		 * time. A line's optional "timestamp" (epoch ms) sets the clock before
		 * it is recorded.
		 */
		int replay(WardenConfig cfg, const std::string &path)
		{
			std::ifstream in(path);
			if (!in.is_open())
			{
				std::cerr << "Unable to open events file: " << path << std::endl;
				return 1;
			}

			boost::asio::io_context ioc;
			auto clock = std::make_shared<ManualClock>();

			EngineDependencies deps;
			deps.clock = clock;
			deps.dispatch_executor = ioc.get_executor();
			auto engine = Engine::create(cfg, std::move(deps));
			if (!engine)
			{
				std::cerr << engine.error().what() << std::endl;
				return 1;
			}

			std::size_t line_no = 0;
			std::size_t rejected = 0;
			std::string line;
			while (std::getline(in, line))
			{
				++line_no;
				if (line.empty())
					continue;

				nlohmann::json j;
				try
				{
					j = nlohmann::json::parse(line);
				}
				catch (const nlohmann::json::parse_error &e)
				{
					std::cerr << "line " << line_no << ": " << e.what() << std::endl;
					++rejected;
					continue;
				}

				if (auto ts = j.find("timestamp"); ts != j.end() && ts->is_number_integer())
					clock->set(from_epoch_ms(ts->get<std::int64_t>()));

				auto raw = RawOccurrence::from_json(j);
				auto recorded = raw ? (*engine)->record_event(*raw) : Result<std::string>(std::unexpected(raw.error()));
				if (!recorded)
				{
					std::cerr << "line " << line_no << ": " << recorded.error().what() << std::endl;
					++rejected;
				}
				ioc.restart();
				ioc.poll();
			}
			ioc.restart();
			ioc.run();

			nlohmann::json incidents = nlohmann::json::array();
			for (const auto &incident : (*engine)->list_incidents())
				incidents.push_back(incident.to_json());
			nlohmann::json outcomes = nlohmann::json::array();
			for (const auto &outcome : (*engine)->action_outcomes())
				outcomes.push_back(outcome.to_json());

			nlohmann::json out{
				{"lines", line_no},
				{"rejected", rejected},
				{"metrics", (*engine)->metrics_summary()},
				{"incidents", incidents},
				{"actions", outcomes}};
			std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
			return rejected == 0 ? 0 : 2;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Warden security event correlation engine"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		std::string log_level{"info"};
		app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON (salt omitted)");
		auto rules_cmd = app.add_subcommand("rules-print", "Print the effective rule set as JSON");

		std::size_t serve_threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
		std::optional<std::uint16_t> serve_port;
		auto serve_cmd = app.add_subcommand("serve", "Run the HTTP ingestion and query server");
		serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads");

		std::string replay_path;
		auto replay_cmd = app.add_subcommand("replay", "Replay a JSON-lines event file and print the result");
		replay_cmd->add_option("--file", replay_path, "Events file, one JSON object per line")->required();

		CLI11_PARSE(app, argc, argv);

		spdlog::set_level(spdlog::level::from_str(log_level));

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*rules_cmd)
		{
			std::vector<Rule> rules = cfg->use_default_rules ? default_rules() : std::vector<Rule>{};
			for (const auto &rule : cfg->rules)
			{
				auto it = std::find_if(rules.begin(), rules.end(), [&](const Rule &r)
									   { return r.id == rule.id; });
				if (it != rules.end())
					*it = rule;
				else
					rules.push_back(rule);
			}
			nlohmann::json out = nlohmann::json::array();
			for (const auto &rule : rules)
				out.push_back(rule.to_json());
			std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			if (serve_port)
				cfg->server.port = *serve_port;
			return serve(std::move(*cfg), serve_threads);
		}

		if (*replay_cmd)
		{
			return replay(std::move(*cfg), replay_path);
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace warden::cli
