// file      : sqlgen/values-header.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/context.hxx>
#include <sqlgen/generate.hxx>

using namespace std;

namespace values
{
  // Value sets with more values do not get the match() helper since its
  // parameter list grows with the number of values.
  //
  const size_t match_threshold = 25;

  struct header: context
  {
    void
    generate (target::entity const&);

  private:
    void
    match (target::entity const&);
  };
}

void values::header::
match (target::entity const& e)
{
  size_t n (e.set.values.size ());

  os << "// Call the handler corresponding to this value and return its" << endl
     << "// result. The handlers are specified in the value order." << endl
     << "//" << endl
     << "template <typename R";

  for (size_t i (0); i != n; ++i)
    os << ", typename H" << i;

  os << ">" << endl
     << "R" << endl
     << "match (";

  for (size_t i (0); i != n; ++i)
    os << (i != 0 ? "," : "") << endl
       << "H" << i << " const& h" << i;

  os << ") const"
     << "{"
     << "switch (i_)"
     << "{";

  for (size_t i (0); i != n; ++i)
    os << "case " << i << ": return h" << i << " ();";

  os << "}"
     << "throw std::logic_error (\"invalid " << e.class_name << " index\");"
     << "}";
}

void values::header::
generate (target::entity const& e)
{
  target::value_set const& s (e.set);
  string const& n (e.class_name);

  string file (hxx_name (e));
  string g (guard (file));

  bool m (s.values.size () <= match_threshold);

  os << "// This file was generated by sqlgen, SQL schema to C++ code" << endl
     << "// generator." << endl
     << "//" << endl
     << "// " << file << endl
     << "//" << endl
     << endl;

  os << "#ifndef " << g << endl
     << "#define " << g << endl
     << endl;

  os << "#include <cstddef>" << endl
     << "#include <cstdint>" << endl
     << "#include <string>" << endl
     << "#include <vector>" << endl
     << "#include <iosfwd>" << endl;

  if (m)
    os << "#include <stdexcept>" << endl;

  os << endl;

  prologue ();

  open_ns (e);

  os << "// Value set " << e.qualified << " (" << s.values.size ()
     << " values of column " << s.value_column << ")." << endl
     << "//" << endl
     << "class " << n
     << "{"
     << "public:" << endl
     << "typedef std::uint32_t index_type;"
     << endl
     << "static const std::size_t count = " << s.values.size () << "UL;"
     << endl;

  // Named constants.
  //
  for (target::entries::const_iterator i (s.values.begin ());
       i != s.values.end (); ++i)
    os << "static const " << n << " " << i->name << ";";

  os << endl;

  // Constructors.
  //
  os << n << " ()" << endl
     << "  : i_ (0)"
     << "{"
     << "}";

  os << "explicit" << endl
     << n << " (index_type i)" << endl
     << "  : i_ (i)"
     << "{"
     << "}";

  // Accessors.
  //
  os << "index_type" << endl
     << "index () const"
     << "{"
     << "return i_;"
     << "}";

  os << "// " << s.value_column << endl
     << "//" << endl
     << "char const*" << endl
     << "value () const"
     << "{"
     << "return value_data_[i_];"
     << "}";

  os << "// " << s.display_column << endl
     << "//" << endl
     << "char const*" << endl
     << "display () const"
     << "{"
     << "return display_data_[i_];"
     << "}";

  for (target::attributes::const_iterator i (s.attrs.begin ());
       i != s.attrs.end (); ++i)
  {
    os << "// " << i->column;

    if (!i->source_type.empty ())
      os << " " << i->source_type;

    if (i->unknown)
      os << ", unmapped source type";

    os << endl
       << "//" << endl
       << member_type (*i) << " const&" << endl
       << i->name << " () const"
       << "{"
       << "return " << i->name << "_data_[i_];"
       << "}";
  }

  // Lookup.
  //
  os << "// Return NULL if there is no such value." << endl
     << "//" << endl
     << "static " << n << " const*" << endl
     << "find (std::string const& value);"
     << endl
     << "// Throw std::invalid_argument if there is no such value." << endl
     << "//" << endl
     << "static " << n << endl
     << "parse (std::string const& value);"
     << endl
     << "static bool" << endl
     << "try_parse (std::string const& value, " << n << "& result);"
     << endl
     << "static std::vector< " << n << " > const&" << endl
     << "all_values ();"
     << endl;

  if (m)
    match (e);

  os << "private:" << endl
     << "index_type i_;"
     << endl
     << "static char const* const value_data_[];"
     << "static char const* const display_data_[];";

  for (target::attributes::const_iterator i (s.attrs.begin ());
       i != s.attrs.end (); ++i)
    os << "static " << member_type (*i) << " const " << i->name
       << "_data_[];";

  os << "};";

  // Comparison.
  //
  char const* ops[] = {"==", "!=", "<"};

  for (size_t i (0); i != 3; ++i)
    os << "inline bool" << endl
       << "operator" << ops[i] << " (" << n << " x, " << n << " y)"
       << "{"
       << "return x.index () " << ops[i] << " y.index ();"
       << "}";

  // Serialization.
  //
  os << "std::string" << endl
     << "to_string (" << n << ");"
     << endl
     << "std::ostream&" << endl
     << "operator<< (std::ostream&, " << n << ");"
     << endl
     << "std::istream&" << endl
     << "operator>> (std::istream&, " << n << "&);";

  close_ns (e);

  os << endl
     << "#endif // " << g << endl;
}

void values::
generate_header (target::entity const& e)
{
  header h;
  h.generate (e);
}
