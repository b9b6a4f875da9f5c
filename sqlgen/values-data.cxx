// file      : sqlgen/values-data.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/context.hxx>
#include <sqlgen/generate.hxx>

using namespace std;

namespace values
{
  struct data: context
  {
    void
    generate (target::entity const&);

  private:
    void
    data_array (string const& type,
                string const& name,
                target::entity const&,
                strings const& initializers);
  };
}

void values::data::
data_array (string const& type,
            string const& name,
            target::entity const& e,
            strings const& inits)
{
  os << type << " const " << e.class_name << "::" << name << "["
     << inits.size () << "] ="
     << "{";

  for (size_t i (0); i != inits.size (); ++i)
    os << inits[i] << (i + 1 != inits.size () ? "," : "") << endl;

  os << "};";
}

void values::data::
generate (target::entity const& e)
{
  target::value_set const& s (e.set);
  target::entries const& es (s.values);
  string const& n (e.class_name);

  os << "// This file was generated by sqlgen, SQL schema to C++ code" << endl
     << "// generator." << endl
     << "//" << endl
     << "// " << data_name (e) << endl
     << "//" << endl
     << endl;

  os << "#include " << strlit (hxx_name (e)) << endl
     << endl
     << "#include <string>" << endl
     << "#include <vector>" << endl
     << "#include <unordered_map>" << endl
     << endl;

  open_ns (e);

  os << "const std::size_t " << n << "::count;"
     << endl;

  // Named constants.
  //
  for (size_t i (0); i != es.size (); ++i)
    os << "const " << n << " " << n << "::" << es[i].name << " (" << i
       << "U);";

  os << endl;

  // Data arrays.
  //
  {
    strings vs, ds;

    for (target::entries::const_iterator i (es.begin ());
         i != es.end (); ++i)
    {
      vs.push_back (strlit (i->value));
      ds.push_back (strlit (i->display));
    }

    data_array ("char const*", "value_data_", e, vs);
    os << endl;
    data_array ("char const*", "display_data_", e, ds);
    os << endl;
  }

  for (size_t j (0); j != s.attrs.size (); ++j)
  {
    target::attribute const& a (s.attrs[j]);
    strings is;

    for (target::entries::const_iterator i (es.begin ());
         i != es.end (); ++i)
      is.push_back (initializer (a, i->attributes[j]));

    data_array (member_type (a), a.name + "_data_", e, is);
    os << endl;
  }

  // Lookup structures. They are built on first use and never modified
  // afterwards.
  //
  os << "namespace"
     << "{"
     << "typedef std::unordered_map<std::string, " << n << "::index_type>"
     << endl
     << "index_map;"
     << endl
     << "index_map" << endl
     << "make_index_map ()"
     << "{"
     << "index_map r (" << n << "::count);"
     << endl
     << "for (" << n << "::index_type i (0); i != " << n << "::count; ++i)"
     << "{"
     << "r.insert (index_map::value_type (" << n << " (i).value (), i));"
     << "}"
     << "return r;"
     << "}"
     << "std::vector< " << n << " >" << endl
     << "make_all_values ()"
     << "{"
     << "std::vector< " << n << " > r;"
     << "r.reserve (" << n << "::count);"
     << endl
     << "for (" << n << "::index_type i (0); i != " << n << "::count; ++i)"
     << "{"
     << "r.push_back (" << n << " (i));"
     << "}"
     << "return r;"
     << "}"
     << "}";

  os << "std::vector< " << n << " > const& " << n << "::" << endl
     << "all_values ()"
     << "{"
     << "static const std::vector< " << n << " > r (make_all_values ());"
     << "return r;"
     << "}";

  os << n << " const* " << n << "::" << endl
     << "find (std::string const& v)"
     << "{"
     << "static const index_map m (make_index_map ());"
     << endl
     << "index_map::const_iterator i (m.find (v));"
     << "return i != m.end () ? &all_values ()[i->second] : 0;"
     << "}";

  close_ns (e);
}

void values::
generate_data (target::entity const& e)
{
  data d;
  d.generate (e);
}
