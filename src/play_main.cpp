// src/play_main.cpp
// midibeep-play: hear a conversion through the sound card instead of the
// PC speaker. Takes the same conversion options as midibeep.

#include "app/cli.hpp"
#include "app/pipeline.hpp"
#include "app/preview.hpp"
#include "audio/player.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_cancel{false}; // lock-free, so usable from a handler

extern "C" void on_interrupt(int) { g_cancel.store(true); }

} // namespace

int main(int argc, char **argv) {
  const std::string argv0 = argc > 0 ? argv[0] : "midibeep-play";
  try {
    const app::Cli cli = app::parse_cli(argc, argv);
    if (cli.help) {
      std::cout << app::usage(argv0);
      return 0;
    }
    logging::set_level(cli.logLevel);

    midi::Song song;
    const tone::ConversionResult result = app::convert_file(cli, song);
    app::print_summary(song, result, cli.policy,
                       logging::enabled(logging::Level::Debug));
    if (result.empty()) {
      LOGW("nothing to play");
      return 0;
    }

    std::signal(SIGINT, on_interrupt);
    audio::play(result, g_cancel);
    return g_cancel.load() ? 130 : 0;
  } catch (const app::UsageError &ex) {
    std::cerr << "error: " << ex.what() << "\n\n" << app::usage(argv0);
    return 2;
  } catch (const common::Error &ex) {
    LOGE(common::to_string(ex.kind()), ": ", ex.what());
    return 1;
  } catch (const std::exception &ex) {
    LOGE(ex.what());
    return 1;
  }
}
