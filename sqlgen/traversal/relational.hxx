// file      : sqlgen/traversal/relational.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_HXX

#include <sqlgen/traversal/relational/column.hxx>
#include <sqlgen/traversal/relational/elements.hxx>
#include <sqlgen/traversal/relational/foreign-key.hxx>
#include <sqlgen/traversal/relational/index.hxx>
#include <sqlgen/traversal/relational/key.hxx>
#include <sqlgen/traversal/relational/model.hxx>
#include <sqlgen/traversal/relational/primary-key.hxx>
#include <sqlgen/traversal/relational/table.hxx>
#include <sqlgen/traversal/relational/view.hxx>

#endif // SQLGEN_TRAVERSAL_RELATIONAL_HXX
