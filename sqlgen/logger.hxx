// file      : sqlgen/logger.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_LOGGER_HXX
#define SQLGEN_LOGGER_HXX

#include <mutex>
#include <string>
#include <iosfwd>

// Progress notification sink. Log entries carry no control flow
// significance.
//
class logger
{
public:
  enum level
  {
    phase, // Start of a compilation phase.
    trace  // Progress within a phase.
  };

  virtual
  ~logger () {}

  virtual void
  log (level, std::string const&) = 0;
};

class null_logger: public logger
{
public:
  virtual void
  log (level, std::string const&) {}
};

// Writes entries to a stream, one per line. Can be shared by several
// threads.
//
class stream_logger: public logger
{
public:
  stream_logger (std::ostream& os): os_ (os) {}

  virtual void
  log (level, std::string const&);

private:
  std::mutex mutex_;
  std::ostream& os_;
};

#endif // SQLGEN_LOGGER_HXX
