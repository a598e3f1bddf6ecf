#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <quill/execution/engine.hpp>
#include <quill/schema/capability.hpp>
#include <quill/schema/governance_status.hpp>
#include <quill/schema/key/engine_keys.hpp>
#include <quill/signing/digest.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

quill::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    throw po::required_option{name};
  }
  auto value = quill::schema::try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    throw po::error{"--" + name + " must be 32 bytes of hex"};
  }
  return *value;
}

quill::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    throw po::required_option{name};
  }
  auto value = quill::schema::try_make_address(vm[name].as<std::string>());
  if (!value) {
    throw po::error{"--" + name + " must be 20 bytes of hex"};
  }
  return *value;
}

quill::schema::capability_t get_capability(const po::variables_map& vm) {
  if (!vm.contains("capability")) {
    throw po::required_option{"capability"};
  }
  auto value = quill::schema::try_from_string<quill::schema::capability_t>(
      vm["capability"].as<std::string>());
  if (!value) {
    throw po::error{"unknown capability"};
  }
  return *value;
}

/// "all" or a comma separated capability list such as "claim,snapshot".
quill::schema::scope_mask_t get_scope_mask(const po::variables_map& vm) {
  auto scopes = vm["scopes"].as<std::string>();
  if (scopes == "all") {
    return quill::schema::all_scopes();
  }
  auto mask = quill::schema::scope_mask_t{0};
  auto stream = std::istringstream{scopes};
  auto name = std::string{};
  while (std::getline(stream, name, ',')) {
    auto capability =
        quill::schema::try_from_string<quill::schema::capability_t>(name);
    if (!capability) {
      throw po::error{"unknown capability '" + name + "' in --scopes"};
    }
    mask |= quill::schema::scope_of(*capability);
  }
  return mask;
}

void print_release(const quill::schema::release_state_t& release) {
  std::cout << "release_id: " << quill::schema::to_hex(release.release_id)
            << '\n'
            << "project_id: " << quill::schema::to_hex(release.project_id)
            << '\n'
            << "context: " << quill::schema::to_hex(release.context) << '\n'
            << "name: " << release.name << '\n'
            << "manifest: " << release.manifest_ref << '\n'
            << "author: " << quill::schema::to_hex(release.author) << '\n'
            << "governance: "
            << quill::schema::to_hex(release.governance_authority) << '\n'
            << "created_at: " << release.created_at << '\n'
            << "status: " << quill::schema::to_string(release.status) << '\n'
            << "revoked: " << (release.revoked ? "true" : "false") << '\n'
            << "snapshots: " << release.snapshots.size() << '\n';
  if (release.superseded_by) {
    std::cout << "superseded_by: "
              << quill::schema::to_hex(*release.superseded_by) << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  quillctl chain-id [--chain-id NAME]\n"
            << "  quillctl keyspaces --db PATH\n"
            << "  quillctl nonce --db PATH --principal ADDR\n"
            << "  quillctl authorized --db PATH --principal ADDR --relayer "
               "ADDR --capability CAP --context HASH --now SECONDS\n"
            << "  quillctl grant-digest --principal ADDR --relayer ADDR "
               "--context HASH --scopes LIST --nonce N --expiry T --deadline "
               "T\n"
            << "  quillctl revoke-digest --principal ADDR --relayer ADDR "
               "--context HASH --nonce N --deadline T\n"
            << "  quillctl release --db PATH --release-id HASH\n"
            << "  quillctl events --db PATH --from ID --to ID\n\n";
  std::cout << options << '\n';
}

/// Run one quillctl command. Invalid arguments throw po::error.
int run(const po::variables_map& vm, const po::options_description& options) {
  auto command =
      vm.contains("command") ? vm["command"].as<std::string>() : std::string{};
  const auto& db_path = vm["db"].as<std::string>();
  const auto& chain_name = vm["chain-id"].as<std::string>();

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto chain_id = quill::signing::make_chain_id(chain_name);

  if (command == "chain-id") {
    std::cout << quill::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  if (command == "grant-digest") {
    auto payload = quill::schema::delegate_authorization_t{
        .principal = get_address(vm, "principal"),
        .relayer = get_address(vm, "relayer"),
        .context = get_hash32(vm, "context"),
        .scope_mask = get_scope_mask(vm),
        .nonce = vm["nonce"].as<uint64_t>(),
        .expiry = vm["expiry"].as<uint64_t>(),
        .deadline = vm["deadline"].as<uint64_t>()};
    auto digest = quill::signing::make_digest(
        quill::signing::make_delegation_domain(chain_id), payload);
    std::cout << quill::schema::to_hex(digest) << '\n';
    return 0;
  }

  if (command == "revoke-digest") {
    auto payload = quill::schema::revoke_authorization_t{
        .principal = get_address(vm, "principal"),
        .relayer = get_address(vm, "relayer"),
        .context = get_hash32(vm, "context"),
        .nonce = vm["nonce"].as<uint64_t>(),
        .deadline = vm["deadline"].as<uint64_t>()};
    auto digest = quill::signing::make_digest(
        quill::signing::make_delegation_domain(chain_id), payload);
    std::cout << quill::schema::to_hex(digest) << '\n';
    return 0;
  }

  auto engine = quill::execution::engine{quill::execution::engine_options{
      .db_path = db_path, .chain_name = chain_name}};

  if (command == "keyspaces") {
    for (const auto prefix : quill::schema::key::kEngineKeyspaces) {
      std::cout << prefix << '\n';
    }
  } else if (command == "nonce") {
    std::cout << engine.delegation().nonce_of(get_address(vm, "principal"))
              << '\n';
  } else if (command == "authorized") {
    auto authorized = engine.delegation().is_authorized(
        get_address(vm, "principal"), get_address(vm, "relayer"),
        get_capability(vm), get_hash32(vm, "context"),
        vm["now"].as<uint64_t>());
    std::cout << (authorized ? "true" : "false") << '\n';
  } else if (command == "release") {
    auto release =
        engine.releases().release_by_id(get_hash32(vm, "release-id"));
    if (!release) {
      std::cerr << "release not found\n";
      return 2;
    }
    print_release(*release);
  } else if (command == "events") {
    auto records =
        engine.events(vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>());
    for (const auto& record : records) {
      std::cout << record.event_id << ' ' << record.event.type;
      for (const auto& attribute : record.event.attributes) {
        std::cout << ' ' << attribute.key << '=' << attribute.value;
      }
      std::cout << '\n';
    }
  } else {
    throw po::error{"unknown command '" + command + "'"};
  }

  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("quillctl.log", false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "quillctl", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);

  auto options = po::options_description{"quillctl options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(),
      "chain-id|keyspaces|nonce|authorized|grant-digest|revoke-digest|"
      "release|events")(
      "db", po::value<std::string>()->default_value("quill.db"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>()->default_value("quill-local"),
      "chain name bound into every signature")(
      "verbose,v", "enable debug logging")(
      "principal", po::value<std::string>(), "principal address hex")(
      "relayer", po::value<std::string>(), "relayer address hex")(
      "context", po::value<std::string>(), "context hash32 hex")(
      "capability", po::value<std::string>(),
      "claim|snapshot|attest|backup|release")(
      "scopes", po::value<std::string>()->default_value("all"),
      "all or comma separated capabilities")(
      "nonce", po::value<uint64_t>()->default_value(0), "signing nonce")(
      "expiry", po::value<uint64_t>()->default_value(0),
      "grant expiry seconds")(
      "deadline", po::value<uint64_t>()->default_value(0),
      "signature deadline seconds")(
      "now", po::value<uint64_t>()->default_value(0), "ledger time seconds")(
      "release-id", po::value<std::string>(), "release hash32 hex")(
      "from", po::value<uint64_t>()->default_value(1), "first event id")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "last event id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  auto status = 0;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    status = run(vm, options);
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    print_help(options);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
