// file      : sqlgen/profile.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <unistd.h>    // stat
#include <sys/types.h> // stat
#include <sys/stat.h>  // stat

#include <cstring>     // std::strcmp
#include <iostream>

#include <sqlgen/profile.hxx>

using namespace std;

profile_data::paths
profile_paths (int argc, char* argv[])
{
  typedef profile_data::path path;

  profile_data::paths r;

  // The --profile-path options have to be known before the options
  // are parsed since profiles are loaded during parsing.
  //
  for (int i (1); i < argc; ++i)
  {
    if (strcmp (argv[i], "--profile-path") == 0 && i + 1 < argc)
      r.push_back (path (argv[++i]));
  }

#ifdef SQLGEN_PROFILE_DIR
  r.push_back (path (SQLGEN_PROFILE_DIR));
#endif

  return r;
}

string
profile_search (char const* prof, void* arg)
{
  typedef profile_data::path path;
  typedef profile_data::paths paths;

  profile_data* pd (static_cast<profile_data*> (arg));
  paths const& ps (pd->search_paths);

  path p (prof), sqlgen ("sqlgen"), r;
  p.normalize (); // Convert '/' to the canonical path separator form.
  p += ".options";

  struct stat info;
  paths::const_iterator i (ps.begin ()), end (ps.end ());

  for (; i != end; ++i)
  {
    // First check in the search directory itself and then try the
    // sqlgen/ subdirectory.
    //
    r = *i / p;

    // Just check that the file exist without checking for permissions, etc.
    //
    if (stat (r.string ().c_str (), &info) == 0 && S_ISREG (info.st_mode))
      break;

    r = *i / sqlgen / p;

    if (stat (r.string ().c_str (), &info) == 0 && S_ISREG (info.st_mode))
      break;
  }

  if (i == end)
  {
    cerr << pd->name << ": error: unable to locate options file for profile '"
         << prof << "'" << endl;
    throw profile_failure ();
  }

  if (pd->loaded.find (r) != pd->loaded.end ())
    return string ();

  pd->loaded.insert (r);
  return r.string ();
}
