// file      : sqlgen/ingestor.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_INGESTOR_HXX
#define SQLGEN_INGESTOR_HXX

#include <string>
#include <vector>

#include <sqlgen/options.hxx>
#include <sqlgen/raw-model.hxx>
#include <sqlgen/diagnostics.hxx>

// Named schema source text. The name is used in diagnostics.
//
struct source
{
  source () {}
  source (std::string const& n, std::string const& t): name (n), text (t) {}

  std::string name;
  std::string text;
};

typedef std::vector<source> sources;

// Parses T-SQL DDL into raw models. Malformed statements are reported as
// parse errors and parsing resumes with the next statement.
//
class ingestor
{
public:
  ingestor (options const&);

  // Parse every source, in parallel if more than one job is configured.
  // The result contains one model per source in the source order and
  // the diagnostics are appended in the same order.
  //
  raw::models
  ingest (sources const&, diagnostics&) const;

  raw::model
  parse (source const&, diagnostics&) const;

private:
  ingestor (ingestor const&);
  ingestor& operator= (ingestor const&);

private:
  options const& ops_;
};

#endif // SQLGEN_INGESTOR_HXX
