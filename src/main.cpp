#include <unistd.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <glog/logging.h>
#include "byte_input.hpp"
#include "byte_stream.hpp"
#include "decoder.hpp"
#include "editor.hpp"
#include "key_parser.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  // log files only; the tty belongs to the editor
  FLAGS_logtostderr = false;
  FLAGS_stderrthreshold = google::GLOG_FATAL;
  google::InitGoogleLogging(argv[0]);

  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [file]\n";
    return 2;
  }
  std::optional<std::filesystem::path> path;
  if (argc == 2) path = std::filesystem::path(argv[1]);

  ReadError err;
  auto stream = std::make_unique<ByteStream>(std::make_unique<FdByteInput>(STDIN_FILENO));
  auto decoder = make_decoder(KEYED_DEFAULT_ENCODING, std::move(stream), err);
  if (!decoder) {
    std::cerr << describe(err) << "\n";
    return 1;
  }
  KeyParser keys(std::move(decoder));

  {
    Terminal session;
    NcursesTerminal term;
    Editor ed(term, keys);
    ed.load_rc(Editor::default_rc_path());
    // a failed open leaves an empty buffer with the error on the message bar
    if (path) ed.open(*path);
    ed.run();
  }
  LOG(INFO) << "session ended";
  google::ShutdownGoogleLogging();
  return 0;
}
