#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strata/model/octree.hpp>
#include <strata/storage/container.hpp>
#include <strata/workspace/workspace.hpp>
#include <bit>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct octree_options final {
  int32_t u_count{};
  int32_t v_count{};
  int32_t w_count{};
  double cell_size{1.0};
  strata::schema::vector3_t origin{};
  double rotation{};
};

bool is_power_of_two(int32_t count) {
  return count > 0 && std::has_single_bit(static_cast<uint32_t>(count));
}

void print_entity(strata::workspace::workspace& workspace,
                  strata::model::entity& entity,
                  int depth) {
  auto line = fmt::format("{:{}}{} '{}' {}", "", depth * 2,
                          to_string(entity.kind()), entity.name(),
                          strata::schema::to_string(entity.uid()));
  if (auto* mesh = entity.as_octree()) {
    if (auto n_cells = mesh->n_cells()) {
      line += fmt::format(" ({} cells)", *n_cells);
    }
  }
  std::cout << line << std::endl;
  for (const auto& child : entity.children()) {
    if (auto* found = workspace.find_entity(child)) {
      print_entity(workspace, *found, depth + 1);
    }
  }
}

void print_summary(strata::workspace::workspace& workspace) {
  print_entity(workspace, workspace.root(), 0);
  std::cout << fmt::format("{} group(s), {} object(s), {} data, {} type(s)",
                           workspace.groups().size(),
                           workspace.objects().size(), workspace.data().size(),
                           workspace.types().size())
            << std::endl;
}

bool create_octree(strata::workspace::workspace& workspace,
                   const std::string& name,
                   const octree_options& options) {
  for (auto count : {options.u_count, options.v_count, options.w_count}) {
    if (!is_power_of_two(count)) {
      spdlog::error("Octree base cell counts must be positive powers of two, "
                    "got {}",
                    count);
      return false;
    }
  }
  if (!(options.cell_size > 0.0)) {
    spdlog::error("Octree cell size must be positive, got {}",
                  options.cell_size);
    return false;
  }

  auto created = workspace.create_object<strata::model::octree>(name);
  if (!created) {
    spdlog::error("Failed to create octree '{}': {}", name, created.log);
    return false;
  }
  auto* mesh = created.value;
  mesh->set_origin(options.origin);
  mesh->set_rotation(options.rotation);
  mesh->set_u_count(options.u_count);
  mesh->set_v_count(options.v_count);
  mesh->set_w_count(options.w_count);
  mesh->set_u_cell_size(options.cell_size);
  mesh->set_v_cell_size(options.cell_size);
  mesh->set_w_cell_size(options.cell_size);
  mesh->base_refine();
  spdlog::info("Created octree '{}' ({}) with {} cells", name,
               strata::schema::to_string(mesh->uid()),
               mesh->n_cells().value_or(0));
  return true;
}

bool remove_entity(strata::workspace::workspace& workspace,
                   const std::string& text) {
  auto uid = strata::schema::try_make_uid(text);
  if (!uid) {
    spdlog::error("'{}' is not a valid uid", text);
    return false;
  }
  if (*uid == workspace.root().uid()) {
    spdlog::error("The root group cannot be removed");
    return false;
  }
  if (workspace.find_entity(*uid) == nullptr) {
    spdlog::error("No entity {} in the container", text);
    return false;
  }
  workspace.remove_entity(*uid);
  spdlog::info("Removed {} and its descendants", text);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("strata.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "strata", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto config_path = std::string{};
  auto container_path = std::string{};
  auto octree_name = std::string{};
  auto remove_uid = std::string{};
  auto octree = octree_options{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Strata"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Read options from an INI style file")(
      "container,d",
      boost::program_options::value<std::string>(&container_path)
          ->default_value("strata.db"),
      "Path of the container store")("verbose,v", "Enable verbose output")(
      "summary,s", "Print the entity tree and collection counts")(
      "create-octree",
      boost::program_options::value<std::string>(&octree_name),
      "Create a base-refined octree with this name")(
      "u-count", boost::program_options::value<int32_t>(&octree.u_count),
      "Octree base cells along u")(
      "v-count", boost::program_options::value<int32_t>(&octree.v_count),
      "Octree base cells along v")(
      "w-count", boost::program_options::value<int32_t>(&octree.w_count),
      "Octree base cells along w")(
      "cell-size",
      boost::program_options::value<double>(&octree.cell_size)
          ->default_value(1.0),
      "Octree base cell size on all axes")(
      "origin-x", boost::program_options::value<double>(&octree.origin.x),
      "Octree origin easting")(
      "origin-y", boost::program_options::value<double>(&octree.origin.y),
      "Octree origin northing")(
      "origin-z", boost::program_options::value<double>(&octree.origin.z),
      "Octree origin elevation")(
      "rotation", boost::program_options::value<double>(&octree.rotation),
      "Octree clockwise rotation in degrees")(
      "remove", boost::program_options::value<std::string>(&remove_uid),
      "Remove the entity with this uid and its descendants");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        spdlog::error("Cannot read config file {}", path);
        spdlog::shutdown();
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(file, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    spdlog::error("{}", e.what());
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto encoder = strata::storage::encoder_t{};
  auto storage = strata::storage::make_storage<
      strata::storage::rocksdb_storage_tag>(container_path);
  auto container = strata::storage::container{encoder, storage};

  auto loaded = container.load();
  if (!loaded) {
    spdlog::error("Failed to load container {}: {} ({})", container_path,
                  loaded.log, to_string(loaded.code));
    spdlog::shutdown();
    return 1;
  }
  auto scope = strata::workspace::active_workspace{loaded.value};
  auto& workspace = scope.get();

  auto status = 0;
  auto changed = false;
  if (vm.contains("create-octree")) {
    if (create_octree(workspace, octree_name, octree)) {
      changed = true;
    } else {
      status = 1;
    }
  }
  if (status == 0 && vm.contains("remove")) {
    if (remove_entity(workspace, remove_uid)) {
      changed = true;
    } else {
      status = 1;
    }
  }
  if (changed) {
    container.finalize(workspace);
  }
  if (status == 0 && vm.contains("summary")) {
    print_summary(workspace);
  }

  spdlog::shutdown();
  return status;
}
