// file      : sqlgen/context.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_CONTEXT_HXX
#define SQLGEN_CONTEXT_HXX

#include <string>
#include <vector>
#include <ostream>
#include <cstddef> // std::size_t

#include <sqlgen/options.hxx>
#include <sqlgen/literal.hxx>
#include <sqlgen/target-model.hxx>

using std::endl;

class generation_failed {};

// Code generation context. Each generating thread establishes its own
// root context which then becomes the current context for this thread.
// The emitters create nested contexts with the default constructor.
//
class context
{
public:
  typedef std::size_t size_t;
  typedef std::string string;
  typedef std::vector<string> strings;
  typedef std::ostream ostream;

  typedef ::options options_type;

  static string
  upcase (string const&);

  // Escape C++ keywords, reserved names, and illegal characters.
  //
  static string
  escape (string const&);

  // Return a string literal that can be used in C++ source code. It
  // includes "".
  //
  static string
  strlit (string const&);

  // Include guard for the file name.
  //
  static string
  guard (string const& file);

  // Opening and closing of the --namespace and schema namespaces.
  //
  void
  open_ns (target::entity const&);

  void
  close_ns (target::entity const&);

  // C++ type of a property or value set attribute, including the
  // nullable wrapper.
  //
  string
  member_type (target::property const&) const;

  // C++ expression initializing a value set attribute of the specified
  // type with a seed value.
  //
  string
  initializer (target::attribute const&, literal const&) const;

  // Header prologue and the artifact names.
  //
  void
  prologue ();

  string
  hxx_name (target::entity const&) const;

  string
  data_name (target::entity const&) const;

  string
  serialization_name (target::entity const&) const;

  // Artifact name stem (<schema>.<name>) with the characters that
  // cannot appear in file names replaced with '_'.
  //
  static string
  file_name (target::entity const&);

public:
  virtual
  ~context ();
  context ();
  context (std::ostream&, options_type const&);

  static context&
  current ()
  {
    return *current_;
  }

public:
  std::ostream& os;
  options_type const& options;

private:
  static thread_local context* current_;

private:
  context&
  operator= (context const&);
};

#endif // SQLGEN_CONTEXT_HXX
