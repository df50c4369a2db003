#include "config/config.hpp"
#include "vfs/fs/observer.hpp"
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <execinfo.h>
#include <fmt/format.h>
#include <fuse3/fuse_opt.h>
#include <unistd.h>

namespace {

struct Options {
  char *config_path{nullptr};
  int show_help{0};
};

const struct fuse_opt kOptionSpec[] = {
    {"--config=%s", offsetof(Options, config_path), 1},
    {"-h", offsetof(Options, show_help), 1},
    {"--help", offsetof(Options, show_help), 1},
    FUSE_OPT_END,
};

void print_backtrace() {
  void *buffer[100];
  int size = backtrace(buffer, 100);
  char **symbols = backtrace_symbols(buffer, size);

  spdlog::error("=== BACKTRACE ===");
  for (int i = 0; i < size; i++) {
    spdlog::error("{}: {}", i, symbols[i]);
  }
  spdlog::error("=================");

  free(symbols);
}

void signal_handler(int signal) {
  spdlog::error("Received signal {} in PID {}", signal, getpid());
  print_backtrace();
  _exit(1);
}

void show_usage(const char *progname) {
  fmt::print("usage: {} --config=<file> [FUSE options] <mountpoint>\n\n"
             "Mounts the storage root named in the configuration file as a\n"
             "read-only FUSE filesystem.\n\n",
             progname);
}

} // namespace

int main(int argc, char *argv[]) {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGILL, signal_handler);
  std::signal(SIGFPE, signal_handler);

  struct fuse_args args = FUSE_ARGS_INIT(argc, argv);
  Options options;

  if (fuse_opt_parse(&args, &options, kOptionSpec, nullptr) == -1) {
    spdlog::error("Failed to parse command line");
    return EXIT_FAILURE;
  }

  if (options.show_help) {
    show_usage(argv[0]);
    fuse_opt_add_arg(&args, "--help");
    args.argv[0][0] = '\0';
  } else if (options.config_path == nullptr) {
    show_usage(argv[0]);
    spdlog::error("Missing --config=<file>");
    fuse_opt_free_args(&args);
    return EXIT_FAILURE;
  }

  int result = EXIT_FAILURE;

  try {
    streamfs::Config config;
    if (!options.show_help) {
      auto loaded = streamfs::Config::load(options.config_path);
      if (!loaded.is_ok()) {
        spdlog::error("{}", loaded.error().what());
        free(options.config_path);
        fuse_opt_free_args(&args);
        return EXIT_FAILURE;
      }
      config = std::move(loaded).value();
    }

    spdlog::set_level(config.logging.level);
    spdlog::info("Starting streamfs over {}", config.storage.root);

    streamfs::State state(std::move(config));
    streamfs::FileSystemObserver observer(state);

    result = observer.run(args);

    spdlog::info("FUSE exited with code: {}, {} handles still open", result,
                 state.handles_.size());
  } catch (const std::exception &e) {
    spdlog::error("Fatal error: {}", e.what());
    print_backtrace();
    result = EXIT_FAILURE;
  }

  free(options.config_path);
  fuse_opt_free_args(&args);
  return result;
}
