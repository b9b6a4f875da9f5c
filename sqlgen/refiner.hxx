// file      : sqlgen/refiner.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_REFINER_HXX
#define SQLGEN_REFINER_HXX

#include <memory> // std::unique_ptr

#include <sqlgen/options.hxx>
#include <sqlgen/raw-model.hxx>
#include <sqlgen/diagnostics.hxx>
#include <sqlgen/semantics/relational.hxx>

// Merges the raw models into a single relational model, resolves the
// foreign keys, and normalizes the keys. All the structural errors are
// reported together. Foreign key resolution is skipped if merging
// failed.
//
class refiner
{
public:
  refiner (options const&);

  // Return NULL if any errors were recorded.
  //
  std::unique_ptr<semantics::relational::model>
  refine (raw::models const&, diagnostics&) const;

private:
  refiner (refiner const&);
  refiner& operator= (refiner const&);

private:
  options const& ops_;
};

#endif // SQLGEN_REFINER_HXX
