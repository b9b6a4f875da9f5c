// file      : sqlgen/profile.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_PROFILE_HXX
#define SQLGEN_PROFILE_HXX

#include <set>
#include <vector>
#include <string>

#include <cutl/fs/path.hxx>

struct profile_data
{
  typedef cutl::fs::path path;
  typedef std::vector<path> paths;

  profile_data (paths const& p, char const* n): search_paths (p), name (n) {}

  paths const& search_paths;
  std::set<path> loaded;
  char const* name;
};

struct profile_failure {};

// Collect the profile search paths: the --profile-path directories in
// the order specified followed by the installed profile directory.
//
profile_data::paths
profile_paths (int argc, char* argv[]);

// Options file search function for the command line scanner. Return
// an empty string if the profile has already been loaded. Issue
// diagnostics and throw profile_failure if it cannot be found.
//
std::string
profile_search (char const* profile, void* arg);

#endif // SQLGEN_PROFILE_HXX
