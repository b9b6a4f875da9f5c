// file      : sqlgen/diagnostics.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_DIAGNOSTICS_HXX
#define SQLGEN_DIAGNOSTICS_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t
#include <sstream>
#include <ostream>

using std::endl;

struct location
{
  location (): line (0), column (0) {}
  location (std::string const& f, std::size_t l, std::size_t c)
      : file (f), line (l), column (c)
  {
  }

  std::string file;
  std::size_t line;
  std::size_t column;
};

std::ostream&
operator<< (std::ostream&, location const&);

struct diagnostic
{
  enum kind_type
  {
    parse_error,
    duplicate_definition,
    reference_error,
    constraint_error,
    type_rule_error,
    output_collision,
    unmapped_type
  };

  enum severity_type
  {
    error,
    warning,
    info
  };

  diagnostic (): kind (parse_error), severity (error) {}
  diagnostic (kind_type k,
              severity_type s,
              location const& l,
              std::string const& m)
      : kind (k), severity (s), loc (l), message (m)
  {
  }

  // Errors are fatal to the run while warnings and informational
  // notes are returned alongside the output.
  //
  bool
  fatal () const
  {
    return severity == error;
  }

  kind_type kind;
  severity_type severity;
  location loc;
  std::string message;
};

std::ostream&
operator<< (std::ostream&, diagnostic::kind_type);

// Print in the file:line:column: severity: message form.
//
std::ostream&
operator<< (std::ostream&, diagnostic const&);

// Ordered diagnostics list. New entries are recorded with the stream
// returned by record() (or the error(), warn(), and info() helpers
// below). The entry is committed when the stream is flushed, normally
// with std::endl. For example:
//
// error (d, diagnostic::parse_error, l) << "expected ')'" << endl;
//
class diagnostics
{
public:
  typedef std::vector<diagnostic> diagnostic_list;
  typedef diagnostic_list::const_iterator iterator;
  typedef diagnostic_list::size_type size_type;

  iterator
  begin () const {return list_.begin ();}

  iterator
  end () const {return list_.end ();}

  size_type
  size () const {return list_.size ();}

  bool
  empty () const {return list_.empty ();}

  diagnostic const&
  operator[] (size_type i) const {return list_[i];}

  // True if any of the entries is fatal.
  //
  bool
  fatal () const;

  size_type
  count (diagnostic::kind_type) const;

  size_type
  count (diagnostic::severity_type) const;

public:
  std::ostream&
  record (diagnostic::kind_type,
          diagnostic::severity_type,
          location const&);

  void
  append (diagnostic const&);

  void
  append (diagnostics const&);

public:
  diagnostics ();
  diagnostics (diagnostics const&);

  diagnostics&
  operator= (diagnostics const&);

private:
  void
  commit ();

  class streambuf: public std::stringbuf
  {
  public:
    streambuf (diagnostics& d): d_ (d) {}

    virtual int
    sync ();

  private:
    diagnostics& d_;
  };

  diagnostic_list list_;
  diagnostic pending_;
  streambuf buf_;
  std::ostream os_;
};

std::ostream&
error (diagnostics&, diagnostic::kind_type, location const&);

std::ostream&
warn (diagnostics&, diagnostic::kind_type, location const&);

std::ostream&
info (diagnostics&, diagnostic::kind_type, location const&);

#endif // SQLGEN_DIAGNOSTICS_HXX
