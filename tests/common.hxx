// file      : tests/common.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TESTS_COMMON_HXX
#define SQLGEN_TESTS_COMMON_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <memory> // std::unique_ptr

#include <sqlgen/options.hxx>
#include <sqlgen/refiner.hxx>
#include <sqlgen/ingestor.hxx>
#include <sqlgen/type-map.hxx>
#include <sqlgen/diagnostics.hxx>
#include <sqlgen/transformer.hxx>
#include <sqlgen/target-model.hxx>

// Parse the options as if they were specified on the command line.
//
inline options
parse_options (std::vector<std::string> const& args)
{
  static char name[] = "sqlgen";

  std::vector<char*> argv;
  argv.push_back (name);

  for (std::vector<std::string>::const_iterator i (args.begin ());
       i != args.end ();
       ++i)
    argv.push_back (const_cast<char*> (i->c_str ()));

  argv.push_back (0);

  int argc (static_cast<int> (argv.size () - 1));
  return options (argc, &argv[0]);
}

inline options
parse_options ()
{
  return parse_options (std::vector<std::string> ());
}

// Run the schema text through ingestion, refinement, and
// transformation. Return NULL if any of the phases failed.
//
inline std::unique_ptr<target::model>
transform_sql (std::string const& sql, options const& o, diagnostics& d)
{
  sources ss;
  ss.push_back (source ("test.sql", sql));

  type_map tm (o.type_map (), o.unknown_type (), d);

  ingestor i (o);
  raw::models ms (i.ingest (ss, d));

  if (d.fatal ())
    return std::unique_ptr<target::model> ();

  refiner r (o);
  std::unique_ptr<semantics::relational::model> m (r.refine (ms, d));

  if (m.get () == 0)
    return std::unique_ptr<target::model> ();

  transformer t (o, tm);
  return t.transform (*m, d);
}

// Return the first diagnostic of the specified kind or NULL.
//
inline diagnostic const*
find_diagnostic (diagnostics const& d, diagnostic::kind_type k)
{
  for (diagnostics::iterator i (d.begin ()); i != d.end (); ++i)
  {
    if (i->kind == k)
      return &*i;
  }

  return 0;
}

inline bool
contains (std::string const& s, std::string const& x)
{
  return s.find (x) != std::string::npos;
}

// Number of non-overlapping occurrences of x in s.
//
inline std::size_t
occurrences (std::string const& s, std::string const& x)
{
  std::size_t n (0);

  for (std::string::size_type p (s.find (x));
       p != std::string::npos;
       p = s.find (x, p + x.size ()))
    n++;

  return n;
}

#endif // SQLGEN_TESTS_COMMON_HXX
