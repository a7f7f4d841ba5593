#include "tiergate/cli.hpp"
#include "tiergate/authorization.hpp"
#include "tiergate/config.hpp"
#include "tiergate/logging.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <iostream>

namespace tiergate::cli
{
	namespace
	{
		Result<TiergateConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_env();
			return ConfigLoader::load(path);
		}

		int report(const TiergateError &err)
		{
			std::cerr << "tiergate: " << err.what() << std::endl;
			if (err.code == ErrorCode::StartupError)
				return kExitStartupRefused;
			return 1;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"tiergate license entitlement runtime"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML (defaults to environment only)");

		std::string requested_tier;
		auto startup_cmd = app.add_subcommand("startup", "Resolve the effective tier for process startup");
		startup_cmd->add_option("--tier", requested_tier, "Requested tier (community, pro, enterprise)");

		auto status_cmd = app.add_subcommand("status", "Print license status as JSON");
		auto refresh_cmd = app.add_subcommand("refresh", "Re-verify the license with the remote verifier");
		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
			return report(cfg.error());

		if (auto level = logging::parse_level(cfg->log.level))
			logging::init(*level);

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		auto engine = AuthorizationEngine::from_config(*cfg);
		if (!engine)
			return report(engine.error());

		if (*startup_cmd)
		{
			std::optional<std::string> requested = cfg->startup.tier;
			if (!requested_tier.empty())
				requested = requested_tier;

			auto resolved = (*engine)->compute_effective_tier_for_startup(requested);
			if (!resolved)
				return report(resolved.error());
			if (resolved->warning)
				std::cerr << "tiergate: warning: " << *resolved->warning << std::endl;
			std::cout << tier_to_string(resolved->tier) << std::endl;
			return 0;
		}

		if (*status_cmd)
		{
			nlohmann::json status;
			status["mode"] = (*engine)->remote_configured() ? "remote" : "local";
			status["license"] = (*engine)->evaluator().license_info();

			auto resolved = (*engine)->resolve_tier();
			if (!resolved)
				return report(resolved.error());
			status["effective_tier"] = tier_to_string(resolved->tier);
			status["warning"] = resolved->warning ? nlohmann::json(*resolved->warning) : nlohmann::json(nullptr);
			std::cout << status.dump(2) << std::endl;
			return 0;
		}

		if (*refresh_cmd)
		{
			auto source = (*engine)->evaluator().load_license_token();
			if (!source)
				return report(source.error());
			if (!*source)
			{
				std::cerr << "tiergate: no license found" << std::endl;
				return 1;
			}

			auto refreshed = (*engine)->refresh((*source)->token);
			if (!refreshed)
				return report(refreshed.error());
			std::cout << refreshed->to_json().dump(2) << std::endl;
			return refreshed->valid ? 0 : 2;
		}

		return 0;
	}

} // namespace tiergate::cli
