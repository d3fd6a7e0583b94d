// src/main.cpp
// midibeep: convert a MIDI file into a script of `beep` commands.
//
//   midibeep song.mid --mode lowest --out-dir out/ --play

#include "app/cli.hpp"
#include "app/pipeline.hpp"
#include "app/preview.hpp"
#include "common/error.hpp"
#include "common/log.hpp"
#include "io/io.hpp"
#include "playback/controller.hpp"
#include "tone/script.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt(int) { g_interrupted = 1; }

// Run the script until it ends or the user hits Ctrl-C.
int play(const std::filesystem::path &script,
         const tone::ConversionResult &result, const app::Cli &cli) {
  std::signal(SIGINT, on_interrupt);

  playback::PlaybackController controller;
  if (cli.format == tone::ScriptFormat::Shell) {
    controller.start(script);
  } else {
    // A GRUB tune is not runnable; play the same tones through beep.
    tone::ScriptOptions opts;
    opts.beepProgram = cli.beepProgram;
    controller.start(result, opts);
  }
  LOGI("playing (Ctrl-C to stop)");

  while (controller.running()) {
    if (g_interrupted) {
      controller.stop();
      LOGI("playback stopped");
      return 130;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  const auto code = controller.wait();
  if (code && *code != 0) {
    LOGW("script exited with status ", *code);
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  const std::string argv0 = argc > 0 ? argv[0] : "midibeep";
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
      LOGW("nothing to play, no script written");
      return 0;
    }

    tone::ScriptOptions opts;
    opts.format = cli.format;
    opts.beepProgram = cli.beepProgram;
    const std::string text = tone::emit_script(result.segments, opts);

    const std::filesystem::path out = io::script_path(
        cli.midiPath, cli.outDir, tone::script_extension(cli.format));
    io::write_script(out, text, cli.format == tone::ScriptFormat::Shell);
    std::cout << "wrote " << out.string() << "\n";

    return cli.play ? play(out, result, cli) : 0;
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
