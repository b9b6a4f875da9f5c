// file      : sqlgen/row-header.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/context.hxx>
#include <sqlgen/generate.hxx>

using namespace std;

namespace row
{
  struct class_: context
  {
    void
    generate (target::entity const&);

  private:
    void
    comment (target::property const&);

    void
    constructors (target::entity const&);

    void
    accessors (target::property const&);

    void
    comparison (target::entity const&);
  };
}

void row::class_::
comment (target::property const& p)
{
  os << "// " << p.column;

  if (!p.source_type.empty ())
    os << " " << p.source_type;

  if (!p.null)
    os << " NOT NULL";

  if (p.identity)
    os << " IDENTITY";

  if (!p.default_.empty ())
    os << " DEFAULT " << p.default_;

  if (p.primary)
    os << ", primary key";

  if (p.foreign)
    os << ", references " << p.foreign_table << "." << p.foreign_column
       << p.foreign_actions;

  os << endl
     << "//" << endl;
}

void row::class_::
constructors (target::entity const& e)
{
  target::properties const& ps (e.props);

  // Default constructor.
  //
  os << e.class_name << " ()";

  for (size_t i (0); i != ps.size (); ++i)
    os << endl
       << (i == 0 ? "  : " : "    ") << ps[i].name << "_ ()"
       << (i + 1 != ps.size () ? "," : "");

  os << "{"
     << "}";

  if (ps.empty ())
    return;

  // Full constructor.
  //
  os << e.class_name << " (";

  for (size_t i (0); i != ps.size (); ++i)
    os << (i != 0 ? "," : "") << endl
       << member_type (ps[i]) << " const& " << ps[i].name;

  os << ")";

  for (size_t i (0); i != ps.size (); ++i)
    os << endl
       << (i == 0 ? "  : " : "    ") << ps[i].name << "_ (" << ps[i].name
       << ")" << (i + 1 != ps.size () ? "," : "");

  os << "{"
     << "}";
}

void row::class_::
accessors (target::property const& p)
{
  string t (member_type (p));

  comment (p);

  os << t << " const&" << endl
     << p.name << " () const"
     << "{"
     << "return this->" << p.name << "_;"
     << "}";

  os << t << "&" << endl
     << p.name << " ()"
     << "{"
     << "return this->" << p.name << "_;"
     << "}";

  os << "void" << endl
     << p.name << " (" << t << " const& x)"
     << "{"
     << "this->" << p.name << "_ = x;"
     << "}";
}

void row::class_::
comparison (target::entity const& e)
{
  target::properties const& ps (e.props);
  string const& n (e.class_name);

  os << "inline bool" << endl
     << "operator== (" << n << " const& x, " << n << " const& y)"
     << "{";

  if (ps.empty ())
    os << "return true;";
  else
  {
    os << "return";

    for (size_t i (0); i != ps.size (); ++i)
      os << endl
         << (i == 0 ? "  " : "  && ")
         << "x." << ps[i].name << " () == y." << ps[i].name << " ()";

    os << ";";
  }

  os << "}";

  os << "inline bool" << endl
     << "operator!= (" << n << " const& x, " << n << " const& y)"
     << "{"
     << "return !(x == y);"
     << "}";
}

void row::class_::
generate (target::entity const& e)
{
  string file (hxx_name (e));
  string g (guard (file));

  os << "// This file was generated by sqlgen, SQL schema to C++ code" << endl
     << "// generator." << endl
     << "//" << endl
     << "// " << file << endl
     << "//" << endl
     << endl;

  os << "#ifndef " << g << endl
     << "#define " << g << endl
     << endl;

  prologue ();

  open_ns (e);

  os << "// " << (e.kind == target::entity::view ? "View " : "Table ")
     << e.qualified << "." << endl
     << "//" << endl
     << "class " << e.class_name
     << "{"
     << "public:" << endl;

  constructors (e);

  target::properties const& ps (e.props);

  for (target::properties::const_iterator i (ps.begin ());
       i != ps.end (); ++i)
    accessors (*i);

  if (!ps.empty ())
  {
    os << "private:" << endl;

    for (target::properties::const_iterator i (ps.begin ());
         i != ps.end (); ++i)
    {
      if (i->unknown)
        os << "// Unmapped source type "
           << (i->source_type.empty () ? "(none)" : i->source_type) << "."
           << endl;

      os << member_type (*i) << " " << i->name << "_;";
    }
  }

  os << "};";

  comparison (e);

  close_ns (e);

  os << endl
     << "#endif // " << g << endl;
}

void row::
generate_header (target::entity const& e)
{
  class_ c;
  c.generate (e);
}
