#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <statesync/checkpoint/directory_reader.hpp>
#include <statesync/manifest/builder.hpp>
#include <statesync/manifest/chunk_source.hpp>
#include <statesync/manifest/file_group.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/manifest/render.hpp>
#include <statesync/manifest/validate.hpp>
#include <statesync/storage/rocksdb/storage.hpp>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct options final {
  std::string checkpoint;
  std::string version{
      statesync::schema::to_string(statesync::schema::kCurrentStateSyncVersion)};
  uint32_t chunk_size{statesync::manifest::kDefaultChunkSize};
  uint32_t sub_manifest_size{statesync::manifest::kMaxSubManifestSize};
  std::size_t threads{1};
  uint64_t group_max_file_size{1u << 13};
  std::string group_suffix;
  std::string db;
  uint64_t height{};
  std::optional<uint32_t> chunk;
  std::optional<statesync::schema::hash32_t> trusted_hash;
  bool print{};
};

void setup_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("statesync.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "statesync", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void report_chunk(const statesync::manifest::chunk_source& source,
                  const uint32_t chunk_id) {
  auto chunk = statesync::manifest::classify_chunk(chunk_id);
  auto bytes = source.get_chunk(chunk_id);
  if (!bytes) {
    spdlog::warn("Chunk {} ({} #{}) is not available", chunk_id,
                 statesync::manifest::to_string(chunk.kind), chunk.index);
    return;
  }
  spdlog::info("Chunk {} ({} #{}) has {} bytes", chunk_id,
               statesync::manifest::to_string(chunk.kind), chunk.index,
               bytes->size());
}

bool check_trusted_hash(const options& opts,
                        const statesync::schema::manifest& manifest) {
  if (!opts.trusted_hash) {
    return true;
  }
  auto error = statesync::schema::manifest_error{};
  if (!statesync::manifest::validate_manifest(manifest, *opts.trusted_hash,
                                              error, opts.sub_manifest_size)) {
    spdlog::error("Manifest does not match the trusted hash: {}",
                  error.message);
    return false;
  }
  spdlog::info("Manifest matches the trusted hash");
  return true;
}

int run_from_storage(const options& opts) {
  auto storage = statesync::storage::make_storage<
      statesync::storage::rocksdb_storage_tag>(opts.db);
  auto loaded = storage.load_manifest(opts.height);
  if (!loaded) {
    auto heights = storage.list_manifest_heights();
    spdlog::error("No manifest stored at height {} ({} height(s) stored)",
                  opts.height, heights.size());
    return 1;
  }
  // The stored meta-manifest keeps the sub-manifest size it was built with.
  auto meta = storage.load_meta_manifest(opts.height);
  auto hash = meta && (*loaded)->version >= statesync::schema::state_sync_version::v2
                  ? statesync::manifest::meta_manifest_hash(*meta)
                  : statesync::manifest::manifest_hash(*loaded);
  spdlog::info("Manifest at height {} has hash {}", opts.height,
               statesync::schema::to_hex(hash));
  if (!check_trusted_hash(opts, *loaded)) {
    return 1;
  }
  if (opts.print) {
    std::cout << *loaded;
  }
  return 0;
}

int run_from_checkpoint(const options& opts) {
  auto version = statesync::schema::try_from_string<
      statesync::schema::state_sync_version>(opts.version);
  if (!version) {
    spdlog::error("Unknown state sync version '{}'", opts.version);
    return 1;
  }

  auto error = std::string{};
  auto files = statesync::checkpoint::read_checkpoint_directory(
      opts.checkpoint, error);
  if (!files) {
    spdlog::error("{}", error);
    return 1;
  }

  auto manifest = statesync::manifest::build_manifest(
      *files, statesync::manifest::build_options{.version = *version,
                                                 .chunk_size = opts.chunk_size,
                                                 .thread_count = opts.threads});
  auto structure_error = statesync::schema::manifest_error{};
  if (!statesync::manifest::validate_manifest_structure(manifest,
                                                        structure_error)) {
    spdlog::error("Computed manifest is invalid: {}", structure_error.message);
    return 1;
  }

  auto groups = statesync::manifest::build_file_group_chunks(
      manifest, statesync::manifest::file_group_options{
                    .max_file_size_bytes = opts.group_max_file_size,
                    .max_group_bytes = opts.chunk_size,
                    .path_suffix = opts.group_suffix});
  auto source = statesync::manifest::chunk_source{
      manifest, std::move(groups),
      statesync::checkpoint::make_directory_chunk_reader(opts.checkpoint),
      opts.sub_manifest_size};

  spdlog::info("{} manifest: {} file(s), {} chunk(s), {} file group(s), {} "
               "sub-manifest(s)",
               statesync::schema::to_string(manifest->version),
               manifest->file_table.size(), manifest->chunk_table.size(),
               source.groups().size(), source.meta().sub_manifest_hashes.size());
  spdlog::info("Manifest hash {}",
               statesync::schema::to_hex(
                   statesync::manifest::manifest_hash(manifest,
                                                      opts.sub_manifest_size)));
  if (!check_trusted_hash(opts, manifest)) {
    return 1;
  }

  if (opts.print) {
    std::cout << manifest;
  }
  if (opts.chunk) {
    report_chunk(source, *opts.chunk);
  }
  if (!opts.db.empty()) {
    auto storage = statesync::storage::make_storage<
        statesync::storage::rocksdb_storage_tag>(opts.db);
    storage.save_manifest(opts.height, manifest, source.meta());
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = options{};
  auto config_file = std::string{};
  auto chunk = uint32_t{};
  auto trusted_hash = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"statesync"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI file with any of the options below")(
      "checkpoint",
      boost::program_options::value<std::string>(&opts.checkpoint),
      "Checkpoint directory to compute the manifest of")(
      "version",
      boost::program_options::value<std::string>(&opts.version)
          ->default_value(opts.version),
      "State sync version of the computed manifest (V0 to V3)")(
      "chunk-size",
      boost::program_options::value<uint32_t>(&opts.chunk_size)
          ->default_value(opts.chunk_size),
      "Maximum size of a file chunk in bytes")(
      "sub-manifest-size",
      boost::program_options::value<uint32_t>(&opts.sub_manifest_size)
          ->default_value(opts.sub_manifest_size),
      "Maximum size of a sub-manifest in bytes")(
      "threads",
      boost::program_options::value<std::size_t>(&opts.threads)
          ->default_value(opts.threads),
      "Number of hashing threads")(
      "group-max-file-size",
      boost::program_options::value<uint64_t>(&opts.group_max_file_size)
          ->default_value(opts.group_max_file_size),
      "Largest file bundled into a file group chunk")(
      "group-suffix",
      boost::program_options::value<std::string>(&opts.group_suffix),
      "Only bundle files whose path ends with this suffix")(
      "db", boost::program_options::value<std::string>(&opts.db),
      "RocksDB path to persist or load manifests")(
      "height",
      boost::program_options::value<uint64_t>(&opts.height)
          ->default_value(opts.height),
      "Checkpoint height")(
      "chunk", boost::program_options::value<uint32_t>(&chunk),
      "Resolve one chunk id and report it")(
      "trusted-hash",
      boost::program_options::value<std::string>(&trusted_hash),
      "Hex manifest hash the manifest must validate against")(
      "print", "Print the manifest tables")("verbose,v",
                                             "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
    if (!config_file.empty()) {
      boost::program_options::store(
          boost::program_options::parse_config_file<char>(config_file.c_str(),
                                                          description),
          vm);
      boost::program_options::notify(vm);
    }
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (vm.contains("chunk")) {
    opts.chunk = chunk;
  }
  if (vm.contains("trusted-hash")) {
    opts.trusted_hash = statesync::schema::try_make_hash32(trusted_hash);
    if (!opts.trusted_hash) {
      std::cerr << "--trusted-hash expects 32 hex encoded bytes" << std::endl;
      return 1;
    }
  }
  opts.print = vm.contains("print");

  setup_logging(vm.contains("verbose"));

  auto status = 1;
  if (!opts.checkpoint.empty()) {
    status = run_from_checkpoint(opts);
  } else if (!opts.db.empty()) {
    status = run_from_storage(opts);
  } else {
    spdlog::error("Either --checkpoint or --db is required");
  }

  spdlog::shutdown();
  return status;
}
