#pragma once

#include <atomic>
#include <istream>
#include <string>

namespace gstmulti {

// Where the interpreter gets its lines from.
class LineSource {
public:
  virtual ~LineSource() = default;

  // False on end of input or after cancel().
  virtual bool read_line(std::string& line) = 0;

  // Unblocks a pending read_line(); may be called from another thread.
  virtual void cancel() {}
};

// Scripted input from any std::istream. cancel() takes effect between lines.
class StreamLineSource : public LineSource {
public:
  explicit StreamLineSource(std::istream& in) : in_(in) {}

  bool read_line(std::string& line) override;
  void cancel() override { cancelled_.store(true); }

private:
  std::istream& in_;
  std::atomic<bool> cancelled_{false};
};

// Reads a file descriptor (stdin for the tool) with poll(), so a blocked read
// can be cancelled when the session ends on its own.
class FdLineSource : public LineSource {
public:
  explicit FdLineSource(int fd, int poll_ms = 100) : fd_(fd), poll_ms_(poll_ms) {}

  bool read_line(std::string& line) override;
  void cancel() override { cancelled_.store(true); }

private:
  int fd_;
  int poll_ms_;
  std::string buf_;
  bool eof_ = false;
  std::atomic<bool> cancelled_{false};
};

} // namespace gstmulti
