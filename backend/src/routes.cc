// ─── FleetGate — API routes implementation ──────────────────────────────

#include "routes.h"
#include "app_context.h"
#include "device_ops.h"
#include "graphql.h"
#include "utils.h"
#include "version.h"

#include <iostream>
#include <optional>

namespace {

// Returns the response to send when the caller may not proceed.
std::optional<crow::response> check_access(AppContext &ctx,
                                           const crow::request &request,
                                           bool admin_only,
                                           AuthSession &auth) {
  auto found = ctx.find_auth(request);
  if (!found) return json_error(ApiError::Unauthenticated, "Not authenticated");
  if (admin_only && !is_allowed_role(found->role, {"admin"}))
    return json_error(ApiError::Forbidden, "Access denied");
  auth = *found;
  return std::nullopt;
}

std::optional<crow::response> resolve_device(AppContext &ctx,
                                             const crow::json::rvalue &body,
                                             DeviceRecord &device) {
  std::string name = json_string(body, "device_name");
  auto found = ctx.inventory.find_by_name(name);
  if (!found) return json_error(ApiError::DeviceNotFound, "Device not found");
  device = *found;
  return std::nullopt;
}

crow::response transport_failure(const TransportError &error) {
  return json_error(api_error_for(error.kind), error.message);
}

std::string device_event_payload(const DeviceRecord &device,
                                 const std::string &detail = "") {
  std::string payload = "{\"device\":\"" + json_escape(device.name) +
                        "\",\"host\":\"" + json_escape(device.host) + "\"";
  if (!detail.empty()) payload += ",\"detail\":\"" + json_escape(detail) + "\"";
  return payload + "}";
}

crow::json::wvalue string_list(const std::vector<std::string> &items) {
  crow::json::wvalue list = crow::json::wvalue::list();
  for (size_t i = 0; i < items.size(); ++i)
    list[static_cast<int>(i)] = items[i];
  return list;
}

// Admin-only "show" command against one device, output under payload_key.
crow::response run_show_route(AppContext &ctx, const crow::request &request,
                              const std::string &command,
                              const std::string &payload_key,
                              const std::string &what) {
  AuthSession auth;
  if (auto denied = check_access(ctx, request, true, auth))
    return std::move(*denied);

  auto body = crow::json::load(request.body);
  DeviceRecord device;
  if (auto missing = resolve_device(ctx, body, device))
    return std::move(*missing);

  TransportError open_error;
  auto channel = ctx.transport.open(device, open_error);
  if (!channel) return transport_failure(open_error);

  std::string output;
  std::string error;
  if (!channel->send_command(command, output, error))
    return json_error(500, "Error retrieving " + what + ": " + error);
  channel.reset();

  ctx.append_audit("device.read", auth, device_event_payload(device, command));

  crow::json::wvalue payload;
  payload["success"] = true;
  payload["device"] = device.name;
  payload[payload_key] = output;
  payload["timestamp"] = now_local();
  return crow::response{payload};
}

// Admin-only config push shared by the security routes.
crow::response run_config_route(AppContext &ctx, const AuthSession &auth,
                                const DeviceRecord &device,
                                const std::vector<std::string> &commands,
                                const std::string &event_type,
                                const std::string &message,
                                const std::string &what) {
  TransportError open_error;
  auto channel = ctx.transport.open(device, open_error);
  if (!channel) return transport_failure(open_error);

  std::string output;
  std::string error;
  if (!channel->enable(error) ||
      !channel->send_config_set(commands, output, error))
    return json_error(500, "Error " + what + ": " + error);
  channel.reset();

  ctx.append_audit(event_type, auth, device_event_payload(device));

  crow::json::wvalue payload;
  payload["success"] = true;
  payload["device"] = device.name;
  payload["message"] = message;
  payload["output"] = output;
  payload["timestamp"] = now_local();
  return crow::response{payload};
}

}  // namespace

// ══════════════════════════════════════════════════════════════════════
//  Health
// ══════════════════════════════════════════════════════════════════════

void register_health_routes(CrowApp &app, AppContext &) {
  CROW_ROUTE(app, "/")([] {
    crow::json::wvalue payload;
    payload["service"] = "FleetGate";
    payload["message"] = "Cisco device management API";
    payload["version"] = APP_VERSION;
    return payload;
  });

  CROW_ROUTE(app, "/api/health")([] {
    crow::json::wvalue payload;
    payload["status"] = "ok";
    payload["version"] = APP_VERSION;
    return payload;
  });
}

// ══════════════════════════════════════════════════════════════════════
//  Auth (login / logout / check_auth)
// ══════════════════════════════════════════════════════════════════════

void register_auth_routes(CrowApp &app, AppContext &ctx) {
  // POST /login
  CROW_ROUTE(app, "/login").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        auto body = crow::json::load(request.body);
        std::string username = json_string(body, "username");
        std::string password = json_string(body, "password");

        auto role = ctx.auth.authenticate(username, password);
        if (!role) {
          ctx.append_audit("auth.login.failure", username, "",
                           "{\"username\":\"" + json_escape(username) + "\"}");
          crow::json::wvalue payload;
          payload["success"] = false;
          payload["message"] = "Invalid username or password";
          return json_response(401, std::move(payload));
        }

        AuthSession auth = ctx.sessions.create(username, *role);
        ctx.append_audit("auth.login.success", auth, "{}");

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["username"] = auth.user;
        payload["role"] = auth.role;
        crow::response res{payload};
        res.add_header("Set-Cookie", ctx.session_cookie_header(auth.token));
        return res;
      });

  // POST /logout
  CROW_ROUTE(app, "/logout").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        if (auto auth = ctx.find_auth(request)) {
          ctx.append_audit("auth.logout", *auth, "{}");
          ctx.sessions.destroy(auth->token);
        }
        crow::json::wvalue payload;
        payload["success"] = true;
        crow::response res{payload};
        res.add_header("Set-Cookie", ctx.expired_cookie_header());
        return res;
      });

  // GET /check_auth
  CROW_ROUTE(app, "/check_auth").methods(crow::HTTPMethod::Get)(
      [&ctx](const crow::request &request) {
        crow::json::wvalue payload;
        auto auth = ctx.find_auth(request);
        payload["authenticated"] = auth.has_value();
        if (auth) {
          payload["username"] = auth->user;
          payload["role"] = auth->role;
        }
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Ping
// ══════════════════════════════════════════════════════════════════════

void register_ping_routes(CrowApp &app, AppContext &ctx) {
  // GET /ping — device list with unknown status
  CROW_ROUTE(app, "/ping").methods(crow::HTTPMethod::Get)(
      [&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, false, auth))
          return std::move(*denied);

        auto devices = ctx.inventory.load();
        crow::json::wvalue payload;
        payload["devices"] = crow::json::wvalue::list();
        for (size_t i = 0; i < devices.size(); ++i) {
          auto &item = payload["devices"][static_cast<int>(i)];
          item["name"] = devices[i].name;
          item["host"] = devices[i].host;
          item["status"] = "unknown";
        }
        return crow::response{payload};
      });

  // POST /ping {target: "all" | <device name>}
  CROW_ROUTE(app, "/ping").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, false, auth))
          return std::move(*denied);

        auto body = crow::json::load(request.body);
        std::string target = "all";
        if (body && body.t() == crow::json::type::Object && body.has("target")) {
          if (body["target"].t() != crow::json::type::String)
            return json_error(ApiError::MalformedInput,
                              "target must be a device name or \"all\"");
          target = body["target"].s();
        }

        std::vector<DeviceRecord> targets;
        if (target == "all") {
          targets = ctx.inventory.load();
        } else {
          auto device = ctx.inventory.find_by_name(target);
          if (!device)
            return json_error(ApiError::DeviceNotFound, "Device not found");
          targets.push_back(*device);
        }

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["results"] = crow::json::wvalue::list();
        for (size_t i = 0; i < targets.size(); ++i) {
          const auto &device = targets[i];
          std::cerr << "[ping] " << device.name << " (" << device.host << ")"
                    << '\n';
          PingResult result = ctx.prober.probe(device.host);
          auto &item = payload["results"][static_cast<int>(i)];
          item["name"] = device.name;
          item["host"] = device.host;
          item["result"] = ping_result_to_json(result);
          item["timestamp"] = now_local();
        }
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Devices
// ══════════════════════════════════════════════════════════════════════

void register_device_routes(CrowApp &app, AppContext &ctx) {
  // GET /devices
  CROW_ROUTE(app, "/devices").methods(crow::HTTPMethod::Get)(
      [&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, false, auth))
          return std::move(*denied);

        auto devices = ctx.inventory.load();
        crow::json::wvalue payload;
        payload["devices"] = crow::json::wvalue::list();
        for (size_t i = 0; i < devices.size(); ++i) {
          auto &item = payload["devices"][static_cast<int>(i)];
          item["name"] = devices[i].name;
          item["host"] = devices[i].host;
          item["device_type"] = devices[i].deviceType;
        }
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Monitoring
// ══════════════════════════════════════════════════════════════════════

void register_monitoring_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/monitoring/config").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return run_show_route(ctx, request, "show running-config", "config",
                              "configuration");
      });

  CROW_ROUTE(app, "/monitoring/interfaces").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return run_show_route(ctx, request, "show ip interface brief",
                              "interfaces", "interfaces");
      });

  CROW_ROUTE(app, "/monitoring/cdp").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return run_show_route(ctx, request, "show cdp neighbors detail",
                              "cdp_neighbors", "CDP neighbors");
      });

  CROW_ROUTE(app, "/monitoring/traffic").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return run_show_route(ctx, request, "show interfaces", "traffic_info",
                              "traffic");
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Maintenance
// ══════════════════════════════════════════════════════════════════════

void register_maintenance_routes(CrowApp &app, AppContext &ctx) {
  // POST /maintenance/patch_simulation — narrative only, no device I/O
  CROW_ROUTE(app, "/maintenance/patch_simulation")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["device"] = device.name;
        payload["simulation_steps"] = string_list(patch_simulation_steps());
        payload["status"] = "completed";
        payload["timestamp"] = now_local();
        return crow::response{payload};
      });

  // POST /maintenance/apply_template {device_name, template_content}
  CROW_ROUTE(app, "/maintenance/apply_template")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        std::vector<std::string> commands;
        std::string parse_error;
        if (!parse_template_commands(json_string(body, "template_content"),
                                     commands, parse_error))
          return json_error(ApiError::MalformedInput, parse_error);

        TransportError open_error;
        auto channel = ctx.transport.open(device, open_error);
        if (!channel) return transport_failure(open_error);
        auto results = apply_template(*channel, commands);
        channel.reset();

        size_t failed = 0;
        for (const auto &result : results) {
          if (result.status != "success") ++failed;
        }
        ctx.append_audit("device.template", auth,
                         device_event_payload(
                             device, std::to_string(results.size()) +
                                         " commands, " +
                                         std::to_string(failed) + " failed"));

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["device"] = device.name;
        payload["results"] = command_results_to_json(results);
        payload["timestamp"] = now_local();
        return crow::response{payload};
      });

  // POST /maintenance/backup {device_name}
  CROW_ROUTE(app, "/maintenance/backup")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        TransportError open_error;
        auto channel = ctx.transport.open(device, open_error);
        if (!channel) return transport_failure(open_error);
        std::string config;
        std::string error;
        if (!channel->enable(error) ||
            !channel->send_command("show running-config", config, error))
          return json_error(500, "Error performing backup: " + error);
        channel.reset();

        std::string path;
        if (!write_backup(ctx.backup_dir, device.name, config, path, error))
          return json_error(500, "Error performing backup: " + error);

        ctx.append_audit("device.backup", auth,
                         device_event_payload(device, path));

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["device"] = device.name;
        payload["message"] = "Backup completed and saved as " + path;
        payload["file"] = path;
        payload["timestamp"] = now_local();
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Security
// ══════════════════════════════════════════════════════════════════════

void register_security_routes(CrowApp &app, AppContext &ctx) {
  // POST /security/change_password
  CROW_ROUTE(app, "/security/change_password")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        std::string new_password = json_string(body, "new_password");
        std::string target_user = json_string(body, "username_to_change", "admin");
        if (new_password.empty())
          return json_error(ApiError::MalformedInput, "Missing new_password");

        TransportError open_error;
        auto channel = ctx.transport.open(device, open_error);
        if (!channel) return transport_failure(open_error);

        std::string output;
        std::string save_output;
        std::string error;
        if (!channel->enable(error) ||
            !channel->send_config_set(
                password_change_commands(target_user, new_password), output,
                error) ||
            !channel->save_config(save_output, error))
          return json_error(500, "Error changing password: " + error);
        channel.reset();

        ctx.append_audit("device.password.change", auth,
                         device_event_payload(device, target_user));

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["device"] = device.name;
        payload["message"] = "Password changed for user " + target_user;
        payload["output"] = output;
        payload["save_output"] = save_output;
        payload["timestamp"] = now_local();
        return crow::response{payload};
      });

  // POST /security/manage_users {device_name, action, username, password}
  CROW_ROUTE(app, "/security/manage_users")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        std::string action = json_string(body, "action");
        std::string username = json_string(body, "username");
        std::vector<std::string> commands;
        std::string error;
        if (!user_management_commands(action, username,
                                      json_string(body, "password"), commands,
                                      error))
          return json_error(ApiError::MalformedInput, error);

        std::string message = action == "add"
                                  ? "User " + username + " added"
                                  : "User " + username + " removed";
        return run_config_route(ctx, auth, device, commands,
                                "device.user." + action, message,
                                "managing users");
      });

  // POST /security/configure_acls {device_name, acl_commands: [...]}
  CROW_ROUTE(app, "/security/configure_acls")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        std::vector<std::string> commands;
        if (body.has("acl_commands")) {
          const auto &list = body["acl_commands"];
          if (list.t() != crow::json::type::List)
            return json_error(ApiError::MalformedInput,
                              "acl_commands must be a list");
          for (const auto &item : list) {
            if (item.t() != crow::json::type::String)
              return json_error(ApiError::MalformedInput,
                                "acl_commands must contain strings");
            commands.push_back(item.s());
          }
        }
        if (commands.empty())
          return json_error(ApiError::MalformedInput, "No ACL commands supplied");

        return run_config_route(ctx, auth, device, commands, "device.acl",
                                "ACLs configured", "configuring ACLs");
      });

  // POST /security/audit {device_name}
  CROW_ROUTE(app, "/security/audit")
      .methods(crow::HTTPMethod::Post)([&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);
        auto body = crow::json::load(request.body);
        DeviceRecord device;
        if (auto missing = resolve_device(ctx, body, device))
          return std::move(*missing);

        TransportError open_error;
        auto channel = ctx.transport.open(device, open_error);
        if (!channel) return transport_failure(open_error);

        crow::json::wvalue results;
        std::string error;
        if (!channel->enable(error))
          return json_error(500, "Error running security audit: " + error);
        for (const auto &command : security_audit_commands()) {
          std::string output;
          if (!channel->send_command(command, output, error))
            return json_error(500, "Error running security audit: " + error);
          results[command] = output;
        }
        channel.reset();

        ctx.append_audit("device.security_audit", auth,
                         device_event_payload(device));

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["device"] = device.name;
        payload["message"] = "Security audit completed";
        payload["results"] = std::move(results);
        payload["timestamp"] = now_local();
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Audit trail
// ══════════════════════════════════════════════════════════════════════

void register_audit_routes(CrowApp &app, AppContext &ctx) {
  // GET /audit?limit=N
  CROW_ROUTE(app, "/audit").methods(crow::HTTPMethod::Get)(
      [&ctx](const crow::request &request) {
        AuthSession auth;
        if (auto denied = check_access(ctx, request, true, auth))
          return std::move(*denied);

        int limit = parse_int_param(request.url_params.get("limit")).value_or(50);
        if (limit <= 0 || limit > 500) limit = 50;
        auto events = ctx.audit.recent(limit);

        crow::json::wvalue payload;
        payload["success"] = true;
        payload["items"] = crow::json::wvalue::list();
        for (size_t i = 0; i < events.size(); ++i) {
          auto &item = payload["items"][static_cast<int>(i)];
          item["id"] = events[i].id;
          item["type"] = events[i].type;
          item["actor"] = events[i].actor;
          item["role"] = events[i].role;
          item["createdAt"] = events[i].createdAt;
          auto parsed = crow::json::load(events[i].payloadJson);
          if (parsed)
            item["payload"] = parsed;
          else
            item["payload"] = events[i].payloadJson;
        }
        return crow::response{payload};
      });
}

void register_all_routes(CrowApp &app, AppContext &ctx) {
  register_health_routes(app, ctx);
  register_auth_routes(app, ctx);
  register_ping_routes(app, ctx);
  register_device_routes(app, ctx);
  register_monitoring_routes(app, ctx);
  register_maintenance_routes(app, ctx);
  register_security_routes(app, ctx);
  register_audit_routes(app, ctx);
  register_graphql_routes(app, ctx);
}
