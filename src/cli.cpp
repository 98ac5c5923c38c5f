#include "warden/cli.hpp"
#include "warden/audit_log.hpp"
#include "warden/config.hpp"
#include "warden/gateway.hpp"
#include "warden/ledger.hpp"
#include "warden/logging.hpp"
#include "warden/resolver.hpp"
#include "warden/rocksdb_store.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace warden::cli
{

	namespace
	{
		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitViolation = 2;

		int fail(const WardenError &error)
		{
			std::cerr << error_code_to_string(error.code) << ": " << error.what();
			if (error.event_id)
				std::cerr << " (event " << *error.event_id << ")";
			std::cerr << std::endl;
			return error.code == ErrorCode::IntegrityViolation ? kExitViolation : kExitError;
		}

		/** Everything a command needs, wired from config */
		struct Runtime
		{
			WardenConfig config;
			std::shared_ptr<RocksDbStore> store;
			std::shared_ptr<Ledger> ledger;
			std::shared_ptr<PermissionCatalog> catalog;
			std::shared_ptr<AuditGateway> gateway;
			std::shared_ptr<GrantResolver> resolver;
		};

		Result<Runtime> open_runtime(const WardenConfig &config)
		{
			Runtime rt;
			rt.config = config;

			auto store = RocksDbStore::open(config.storage);
			if (!store)
				return std::unexpected(store.error());
			rt.store = *store;

			std::shared_ptr<AuditLogger> mirror;
			if (config.audit.mirror_to_log)
			{
				auto opened = AuditLogger::open_file(config.audit.log_path);
				if (!opened)
					return std::unexpected(opened.error());
				mirror = *opened;
			}

			rt.ledger = std::make_shared<Ledger>(rt.store, std::make_shared<SystemClock>(), config.ledger_options());
			rt.catalog = std::make_shared<PermissionCatalog>(rt.store);
			auto loaded = rt.catalog->reload();
			if (!loaded)
				return std::unexpected(loaded.error());

			rt.gateway = std::make_shared<AuditGateway>(rt.ledger, mirror);
			rt.resolver = std::make_shared<GrantResolver>(rt.catalog, rt.gateway, nullptr, config.resolver_options());
			return rt;
		}

		Result<std::optional<Timestamp>> optional_time(const std::string &text)
		{
			if (text.empty())
				return std::optional<Timestamp>{};
			auto parsed = parse_iso8601(text);
			if (!parsed)
				return std::unexpected(parsed.error());
			return std::optional<Timestamp>(*parsed);
		}

		std::optional<std::string> optional_text(const std::string &text)
		{
			if (text.empty())
				return std::nullopt;
			return text;
		}

		nlohmann::json events_json(const std::vector<Event> &events)
		{
			nlohmann::json out = nlohmann::json::array();
			for (const auto &event : events)
				out.push_back(event.to_json());
			return out;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Warden audit ledger and authorization core"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print the effective config as JSON");

		std::string actor;
		auto seed_cmd = app.add_subcommand("seed", "Seed the default roles and permissions");
		seed_cmd->add_option("--actor", actor, "Acting user id")->required();

		std::string verify_from;
		std::string verify_to;
		std::string verify_anchor;
		auto verify_cmd = app.add_subcommand("verify", "Verify the hash chain");
		verify_cmd->add_option("--from", verify_from, "First event id");
		verify_cmd->add_option("--to", verify_to, "Last event id");
		verify_cmd->add_option("--anchor", verify_anchor, "Trusted hash preceding --from");

		std::string q_name;
		std::string q_severity;
		std::string q_actor;
		std::string q_subject;
		std::string q_since;
		std::string q_until;
		auto query_cmd = app.add_subcommand("query", "Print matching events as JSON lines");
		query_cmd->add_option("--name", q_name, "Event name");
		query_cmd->add_option("--severity", q_severity, "noise, important or critical");
		query_cmd->add_option("--actor", q_actor, "Actor id");
		query_cmd->add_option("--subject", q_subject, "Subject id");
		query_cmd->add_option("--since", q_since, "Inclusive ISO 8601 lower bound");
		query_cmd->add_option("--until", q_until, "Exclusive ISO 8601 upper bound");

		auto stale_cmd = app.add_subcommand("stale", "List stale noise and important events");

		auto purge_cmd = app.add_subcommand("purge", "Delete stale events behind checkpoints");
		purge_cmd->add_option("--actor", actor, "Acting user id")->required();

		std::string user;
		std::string role;
		std::string permission;
		std::string scope_text;
		auto bind_cmd = app.add_subcommand("bind-role", "Bind a role to a user");
		bind_cmd->add_option("--actor", actor, "Acting user id")->required();
		bind_cmd->add_option("--user", user, "User id")->required();
		bind_cmd->add_option("--role", role, "Role name")->required();

		auto grant_cmd = app.add_subcommand("grant", "Grant a permission directly to a user");
		grant_cmd->add_option("--actor", actor, "Acting user id")->required();
		grant_cmd->add_option("--user", user, "User id")->required();
		grant_cmd->add_option("--permission", permission, "Permission name")->required();
		grant_cmd->add_option("--scope", scope_text, "Scope JSON object");

		auto revoke_cmd = app.add_subcommand("revoke", "Revoke a direct grant");
		revoke_cmd->add_option("--actor", actor, "Acting user id")->required();
		revoke_cmd->add_option("--user", user, "User id")->required();
		revoke_cmd->add_option("--permission", permission, "Permission name")->required();
		revoke_cmd->add_option("--scope", scope_text, "Scope JSON object");

		auto check_cmd = app.add_subcommand("check", "Decide whether a user holds a permission");
		check_cmd->add_option("--user", user, "User id")->required();
		check_cmd->add_option("--permission", permission, "Permission name")->required();
		check_cmd->add_option("--scope", scope_text, "Request scope JSON object");

		auto effective_cmd = app.add_subcommand("effective", "List a user's effective permissions");
		effective_cmd->add_option("--user", user, "User id")->required();

		CLI11_PARSE(app, argc, argv);

		auto cfg = config_path.empty() ? ConfigLoader::from_env() : ConfigLoader::load(config_path);
		if (!cfg)
			return fail(cfg.error());

		auto logging = init_logging(cfg->logging);
		if (!logging)
			return fail(logging.error());

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		auto rt = open_runtime(*cfg);
		if (!rt)
			return fail(rt.error());

		if (*seed_cmd)
		{
			auto created = rt->resolver->seed_defaults(actor);
			if (!created)
				return fail(created.error());
			std::cout << nlohmann::json{{"records_created", *created}}.dump() << std::endl;
			return kExitOk;
		}

		if (*verify_cmd)
		{
			VerifyOptions options{optional_text(verify_from), optional_text(verify_to), optional_text(verify_anchor)};
			auto report = rt->ledger->verify_chain(options);
			if (!report)
				return fail(report.error());
			std::cout << report->to_json().dump(2) << std::endl;
			return kExitOk;
		}

		if (*query_cmd)
		{
			EventFilter filter;
			filter.name = optional_text(q_name);
			filter.actor_id = optional_text(q_actor);
			filter.subject_id = optional_text(q_subject);
			if (!q_severity.empty())
			{
				auto severity = severity_from_string(q_severity);
				if (!severity)
					return fail(severity.error());
				filter.severity = *severity;
			}
			auto since = optional_time(q_since);
			if (!since)
				return fail(since.error());
			auto until = optional_time(q_until);
			if (!until)
				return fail(until.error());
			filter.since = *since;
			filter.until = *until;

			auto cursor = rt->ledger->query(filter);
			while (true)
			{
				auto event = cursor.next();
				if (!event)
					return fail(event.error());
				if (!*event)
					break;
				std::cout << (*event)->to_json().dump() << "\n";
			}
			std::cout.flush();
			return kExitOk;
		}

		if (*stale_cmd)
		{
			auto view = rt->ledger->stale_events(rt->ledger->clock().now());
			if (!view)
				return fail(view.error());
			nlohmann::json out = {
				{"stale_noise", events_json(view->stale_noise)},
				{"stale_important", events_json(view->stale_important)}};
			std::cout << out.dump(2) << std::endl;
			return kExitOk;
		}

		if (*purge_cmd)
		{
			auto report = rt->gateway->purge_stale(actor);
			if (!report)
				return fail(report.error());
			std::cout << report->to_json().dump(2) << std::endl;
			return kExitOk;
		}

		auto scope = scope_text.empty() ? Result<Scope>(Scope{}) : Scope::parse_text(scope_text);
		if (!scope)
			return fail(scope.error());

		if (*bind_cmd)
		{
			auto target = rt->catalog->snapshot()->find_role_by_name(role);
			if (!target)
				return fail(WardenError::not_found("role not found: " + role));
			auto bound = rt->resolver->bind_role(actor, user, target->id);
			if (!bound)
				return fail(bound.error());
			return kExitOk;
		}

		if (*grant_cmd || *revoke_cmd)
		{
			auto target = rt->catalog->snapshot()->find_permission_by_name(permission);
			if (!target)
				return fail(WardenError::not_found("permission not found: " + permission));

			auto grant = *grant_cmd
							 ? rt->resolver->grant_permission(actor, user, target->id, *scope)
							 : rt->resolver->revoke_permission(actor, user, target->id, *scope);
			if (!grant)
				return fail(grant.error());
			std::cout << grant->to_json().dump(2) << std::endl;
			return kExitOk;
		}

		if (*check_cmd)
		{
			auto decision = rt->resolver->decide(user, permission, *scope);
			std::cout << decision_to_json(decision).dump(2) << std::endl;
			return is_allowed(decision) ? kExitOk : kExitViolation;
		}

		if (*effective_cmd)
		{
			std::cout << rt->resolver->effective_permissions(user).to_json().dump(2) << std::endl;
			return kExitOk;
		}

		std::cout << app.help() << std::endl;
		return kExitOk;
	}

} // namespace warden::cli
