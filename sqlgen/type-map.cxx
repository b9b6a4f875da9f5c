// file      : sqlgen/type-map.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype>  // std::toupper, std::isspace
#include <ostream>

#include <sqlgen/type-map.hxx>

using namespace std;

namespace
{
  string
  upcase (string const& s)
  {
    string r;
    r.reserve (s.size ());

    for (string::size_type i (0); i != s.size (); ++i)
      r += static_cast<char> (toupper (static_cast<unsigned char> (s[i])));

    return r;
  }

  // Upper-case and drop the whitespaces so that "nvarchar (50)" compares
  // equal to the normalized NVARCHAR(50).
  //
  string
  normalize (string const& s)
  {
    string r;
    r.reserve (s.size ());

    for (string::size_type i (0); i != s.size (); ++i)
    {
      unsigned char c (static_cast<unsigned char> (s[i]));

      if (!isspace (c))
        r += static_cast<char> (toupper (c));
    }

    return r;
  }
}

type_map::
type_map (type_map_rules const& rs, string const& unknown, diagnostics& d)
    : unknown_ (unknown)
{
  for (size_t i (0); i != rs.size (); ++i)
  {
    type_map_rule const& r (rs[i]);

    rule c;
    c.r = r;
    c.index = i;
    c.regex = r.regex;

    // The type pattern is always declared.
    //
    string const* ps[] = {&r.schema, &r.table, &r.column, &r.type};
    pattern* cs[] = {&c.schema, &c.table, &c.column, &c.type};

    bool valid (true);

    for (size_t j (0); j != 4; ++j)
    {
      string const& p (*ps[j]);
      pattern& cp (*cs[j]);

      if (p.empty () && j != 3)
        continue;

      cp.declared = true;

      if (!r.regex)
      {
        cp.text = normalize (p);
        cp.params = j == 3 && p.find ('(') != string::npos;

        // Canonicalize type aliases (INTEGER, CHARACTER VARYING, etc)
        // if the pattern is a valid type declaration.
        //
        if (j == 3)
        {
          try
          {
            sql_type t (sql_type::parse (p));

            if (t.type != sql_type::other && t.type != sql_type::invalid)
              cp.text = cp.params ? t.string () : t.name ();
          }
          catch (invalid_sql_type const&)
          {
            // Not a type declaration. Compare as written.
          }
        }

        continue;
      }

      try
      {
        cp.text = p;
        cp.re.assign (p, true); // case-insensitive
      }
      catch (regex_format const& e)
      {
        error (d, diagnostic::type_rule_error, location ())
          << "invalid regex '" << e.regex () << "' in type mapping rule '"
          << r.string () << "': " << e.description () << endl;

        valid = false;
        break;
      }
    }

    if (valid)
      rules_.push_back (c);
  }
}

bool type_map::
match_name (rule const& r, pattern const& p, string const& n) const
{
  if (!p.declared)
    return true;

  return r.regex ? p.re.match (n) : p.text == upcase (n);
}

bool type_map::
match_type (rule const& r, sql_type const& t) const
{
  pattern const& p (r.type);

  if (r.regex)
    return p.re.match (t.name ()) || p.re.match (t.string ());

  if (p.text == upcase (t.name ()))
    return true;

  return p.params && p.text == upcase (t.string ());
}

type_resolution type_map::
resolve (string const& schema,
         string const& table,
         string const& column,
         sql_type const& t) const
{
  type_resolution res;
  res.type = unknown_;

  // Columns without a type (declared-only view columns) are never
  // mapped.
  //
  if (t.type == sql_type::invalid)
    return res;

  rule const* best (0);
  unsigned short bs (0);

  for (rules::const_iterator i (rules_.begin ()); i != rules_.end (); ++i)
  {
    if (!match_type (*i, t) ||
        !match_name (*i, i->schema, schema) ||
        !match_name (*i, i->table, table) ||
        !match_name (*i, i->column, column))
      continue;

    unsigned short s (i->r.patterns ());

    // Strictly greater so that the first specified rule wins a tie.
    //
    if (best == 0 || s > bs)
    {
      best = &*i;
      bs = s;
    }
  }

  if (best != 0)
  {
    res.type = best->r.as;
    res.rule = &best->r;
    res.index = best->index;
    res.specificity = bs;
  }

  return res;
}

void type_map::
print (ostream& os) const
{
  for (rules::const_iterator i (rules_.begin ()); i != rules_.end (); ++i)
    os << i->index + 1 << ": [" << i->r.patterns () << "] "
       << i->r.string () << endl;
}
