// file      : sqlgen/option-types.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <istream>
#include <ostream>

#include <sqlgen/option-types.hxx>

using namespace std;

static string
trim (string const& s)
{
  string::size_type b (s.find_first_not_of (" \t"));

  if (b == string::npos)
    return string ();

  string::size_type e (s.find_last_not_of (" \t"));
  return string (s, b, e - b + 1);
}

//
// type_map_rule
//

string type_map_rule::
string () const
{
  std::string r (regex ? "regex:" : "");

  if (!schema.empty ())
    r += "schema=" + schema + ';';

  if (!table.empty ())
    r += "table=" + table + ';';

  if (!column.empty ())
    r += "column=" + column + ';';

  r += "type=" + type + ";as=" + as;
  return r;
}

istream&
operator>> (istream& is, type_map_rule& r)
{
  string s;
  getline (is, s);

  if (is.fail ())
    return is;

  r = type_map_rule ();

  if (s.compare (0, 6, "regex:") == 0)
  {
    r.regex = true;
    s.erase (0, 6);
  }

  // Short form: <type>=<target>.
  //
  if (s.find (';') == string::npos)
  {
    string::size_type p (s.find ('='));

    if (p != string::npos)
    {
      string k (trim (string (s, 0, p)));

      if (k != "schema" && k != "table" && k != "column" &&
          k != "type" && k != "as")
      {
        r.type = k;
        r.as = trim (string (s, p + 1));

        if (r.type.empty () || r.as.empty ())
          is.setstate (istream::failbit);

        return is;
      }
    }
  }

  // Long form: <key>=<value>[;<key>=<value>]...
  //
  for (string::size_type b (0);;)
  {
    string::size_type e (s.find (';', b));
    string f (trim (string (s, b, e == string::npos ? string::npos : e - b)));

    if (!f.empty ())
    {
      string::size_type p (f.find ('='));

      if (p == string::npos)
      {
        is.setstate (istream::failbit);
        return is;
      }

      string k (trim (string (f, 0, p)));
      string v (trim (string (f, p + 1)));

      string* d (0);

      if (k == "schema")
        d = &r.schema;
      else if (k == "table")
        d = &r.table;
      else if (k == "column")
        d = &r.column;
      else if (k == "type")
        d = &r.type;
      else if (k == "as")
        d = &r.as;

      // Unknown, repeated, or empty field.
      //
      if (d == 0 || !d->empty () || v.empty ())
      {
        is.setstate (istream::failbit);
        return is;
      }

      *d = v;
    }

    if (e == string::npos)
      break;

    b = e + 1;
  }

  if (r.type.empty () || r.as.empty ())
    is.setstate (istream::failbit);

  return is;
}

ostream&
operator<< (ostream& os, type_map_rule const& r)
{
  return os << r.string ();
}

//
// value_set_spec
//

istream&
operator>> (istream& is, value_set_spec& v)
{
  string s;
  getline (is, s);

  if (is.fail ())
    return is;

  v = value_set_spec ();

  string::size_type p (s.find ('='));
  v.table = trim (string (s, 0, p));

  if (p != string::npos)
  {
    string cs (s, p + 1);
    string::size_type c (cs.find (','));

    v.value = trim (string (cs, 0, c));

    if (c != string::npos)
    {
      v.display = trim (string (cs, c + 1));

      if (v.display.empty ())
        is.setstate (istream::failbit);
    }

    if (v.value.empty ())
      is.setstate (istream::failbit);
  }

  if (v.table.empty ())
    is.setstate (istream::failbit);

  return is;
}

ostream&
operator<< (ostream& os, value_set_spec const& v)
{
  os << v.table;

  if (!v.value.empty ())
  {
    os << '=' << v.value;

    if (!v.display.empty ())
      os << ',' << v.display;
  }

  return os;
}
