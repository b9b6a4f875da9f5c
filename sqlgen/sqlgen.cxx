// file      : sqlgen/sqlgen.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>

#include <cutl/fs/path.hxx>
#include <cutl/fs/auto-remove.hxx>

#include <sqlgen/logger.hxx>
#include <sqlgen/options.hxx>
#include <sqlgen/profile.hxx>
#include <sqlgen/version.hxx>
#include <sqlgen/type-map.hxx>
#include <sqlgen/orchestrator.hxx>

using namespace std;
using cutl::fs::path;
using cutl::fs::invalid_path;

namespace fs = cutl::fs;

struct io_failure {};

// Read the whole file. Issue diagnostics and throw io_failure if
// anything goes wrong.
//
static string
read_file (path const& p, char const* name)
{
  ifstream ifs (p.string ().c_str (), ios_base::in | ios_base::binary);

  if (!ifs.is_open ())
  {
    cerr << name << ": error: unable to open '" << p << "' in read mode"
         << endl;
    throw io_failure ();
  }

  ostringstream os;
  os << ifs.rdbuf ();

  if (ifs.bad ())
  {
    cerr << name << ": error: unable to read '" << p << "'" << endl;
    throw io_failure ();
  }

  return os.str ();
}

int
main (int argc, char* argv[])
{
  ostream& e (cerr);

  try
  {
    profile_data::paths prof_paths (profile_paths (argc, argv));

    profile_data pd (prof_paths, argv[0]);
    cli::argv_file_scanner::option_info oi[3];
    oi[0].option = "--options-file";
    oi[0].search_func = 0;
    oi[1].option = "-p";
    oi[1].search_func = &profile_search;
    oi[1].arg = &pd;
    oi[2].option = "--profile";
    oi[2].search_func = &profile_search;
    oi[2].arg = &pd;

    cli::argv_file_scanner scan (argc, argv, oi, 3);

    options ops (scan);

    // Handle --version.
    //
    if (ops.version ())
    {
      e << "sqlgen SQL schema to C++ code generator " SQLGEN_VERSION_STR
        << endl;

      e << "This is free software; see the source for copying conditions. "
        << "There is NO\nwarranty; not even for MERCHANTABILITY or FITNESS "
        << "FOR A PARTICULAR PURPOSE." << endl;

      return 0;
    }

    // Handle --help.
    //
    if (ops.help ())
    {
      e << "Usage: " << argv[0] << " [options] file [file ...]"
        << endl
        << "Options:" << endl;

      options::print_usage (e);
      return 0;
    }

    if (ops.show_rules ())
    {
      // Invalid rules are reported by the compilation.
      //
      diagnostics d;
      type_map m (ops.type_map (), ops.unknown_type (), d);
      m.print (e);
    }

    if (!scan.more ())
    {
      e << argv[0] << ": error: input file expected" << endl;
      return 1;
    }

    sources ss;

    while (scan.more ())
    {
      path p (scan.next ());
      ss.push_back (source (p.string (), read_file (p, argv[0])));
    }

    stream_logger sl (e);
    null_logger nl;
    logger& l (ops.trace () ? static_cast<logger&> (sl) : nl);

    artifacts out;
    diagnostics d;
    bool r;
    {
      orchestrator o (ops, l);
      r = o.run (ss, out, d);
    }

    for (diagnostics::iterator i (d.begin ()); i != d.end (); ++i)
      e << *i << endl;

    if (!r)
      return 1;

    // Write the artifacts. Remove the files already written if any of
    // them fails.
    //
    path dir (ops.output_dir ());
    fs::auto_removes auto_rm;

    for (artifacts::const_iterator i (out.begin ()); i != out.end (); ++i)
    {
      path p (dir.empty () ? path (i->first) : dir / path (i->first));

      ofstream ofs (p.string ().c_str (), ios_base::out | ios_base::binary);

      if (!ofs.is_open ())
      {
        e << argv[0] << ": error: unable to open '" << p << "' in write mode"
          << endl;
        return 1;
      }

      auto_rm.add (p);

      ofs << i->second;

      if (!ofs.good ())
      {
        e << argv[0] << ": error: unable to write '" << p << "'" << endl;
        return 1;
      }

      if (ops.trace ())
        l.log (logger::trace, "wrote " + p.string ());
    }

    auto_rm.cancel ();
    return 0;
  }
  catch (profile_failure const&)
  {
    // Diagnostics has already been issued.
    //
    return 1;
  }
  catch (io_failure const&)
  {
    // Diagnostics has already been issued.
    //
    return 1;
  }
  catch (invalid_path const& ex)
  {
    e << argv[0] << ": error: invalid path '" << ex.path () << "'" << endl;
    return 1;
  }
  catch (cli::exception const& ex)
  {
    e << ex << endl;
    return 1;
  }
}
