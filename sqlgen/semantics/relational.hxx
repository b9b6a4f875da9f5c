// file      : sqlgen/semantics/relational.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_HXX

#include <sqlgen/semantics/relational/column.hxx>
#include <sqlgen/semantics/relational/elements.hxx>
#include <sqlgen/semantics/relational/foreign-key.hxx>
#include <sqlgen/semantics/relational/index.hxx>
#include <sqlgen/semantics/relational/key.hxx>
#include <sqlgen/semantics/relational/model.hxx>
#include <sqlgen/semantics/relational/name.hxx>
#include <sqlgen/semantics/relational/primary-key.hxx>
#include <sqlgen/semantics/relational/table.hxx>
#include <sqlgen/semantics/relational/view.hxx>

#endif // SQLGEN_SEMANTICS_RELATIONAL_HXX
