// file      : sqlgen/values-serialization.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/context.hxx>
#include <sqlgen/generate.hxx>

using namespace std;

namespace values
{
  struct serialization: context
  {
    void
    generate (target::entity const&);
  };
}

void values::serialization::
generate (target::entity const& e)
{
  string const& n (e.class_name);

  os << "// This file was generated by sqlgen, SQL schema to C++ code" << endl
     << "// generator." << endl
     << "//" << endl
     << "// " << serialization_name (e) << endl
     << "//" << endl
     << endl;

  os << "#include " << strlit (hxx_name (e)) << endl
     << endl
     << "#include <string>" << endl
     << "#include <istream>" << endl
     << "#include <ostream>" << endl
     << "#include <stdexcept>" << endl
     << endl;

  open_ns (e);

  os << "std::string" << endl
     << "to_string (" << n << " v)"
     << "{"
     << "return v.value ();"
     << "}";

  os << n << " " << n << "::" << endl
     << "parse (std::string const& s)"
     << "{"
     << n << " const* v (find (s));"
     << endl
     << "if (v == 0)" << endl
     << "throw std::invalid_argument ("
     << strlit ("invalid " + e.qualified + " value '") << " + s + \"'\");"
     << endl
     << "return *v;"
     << "}";

  os << "bool " << n << "::" << endl
     << "try_parse (std::string const& s, " << n << "& r)"
     << "{"
     << n << " const* v (find (s));"
     << endl
     << "if (v == 0)" << endl
     << "return false;"
     << endl
     << "r = *v;"
     << "return true;"
     << "}";

  os << "std::ostream&" << endl
     << "operator<< (std::ostream& os, " << n << " v)"
     << "{"
     << "return os << v.value ();"
     << "}";

  // Values containing whitespaces do not survive stream extraction.
  //
  os << "std::istream&" << endl
     << "operator>> (std::istream& is, " << n << "& v)"
     << "{"
     << "std::string s;"
     << endl
     << "if (is >> s && !" << n << "::try_parse (s, v))" << endl
     << "is.setstate (std::istream::failbit);"
     << endl
     << "return is;"
     << "}";

  close_ns (e);
}

void values::
generate_serialization (target::entity const& e)
{
  serialization s;
  s.generate (e);
}
