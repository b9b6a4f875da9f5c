// file      : sqlgen/transformer.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRANSFORMER_HXX
#define SQLGEN_TRANSFORMER_HXX

#include <memory> // std::unique_ptr

#include <sqlgen/options.hxx>
#include <sqlgen/type-map.hxx>
#include <sqlgen/diagnostics.hxx>
#include <sqlgen/target-model.hxx>
#include <sqlgen/semantics/relational.hxx>

// Builds the C++ code model from the refined relational model. Every
// table and view becomes a row entity unless the table was specified
// with --value-set in which case it becomes a value set. Columns with
// unmapped types are reported as warnings.
//
class transformer
{
public:
  transformer (options const&, type_map const&);

  // Return NULL if any errors were recorded.
  //
  std::unique_ptr<target::model>
  transform (semantics::relational::model&, diagnostics&) const;

private:
  transformer (transformer const&);
  transformer& operator= (transformer const&);

private:
  options const& ops_;
  type_map const& map_;
};

#endif // SQLGEN_TRANSFORMER_HXX
