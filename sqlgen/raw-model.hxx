// file      : sqlgen/raw-model.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_RAW_MODEL_HXX
#define SQLGEN_RAW_MODEL_HXX

#include <string>
#include <vector>

#include <sqlgen/literal.hxx>
#include <sqlgen/sql-type.hxx>
#include <sqlgen/diagnostics.hxx>
#include <sqlgen/semantics/relational/name.hxx>

// Unvalidated per-source extraction of the schema statements. Names are
// as written (unqualified names are qualified by the refiner).
//
namespace raw
{
  using semantics::relational::qname;

  enum action_type
  {
    no_action,
    cascade,
    set_null,
    set_default
  };

  struct column
  {
    column ()
        : null (true), identity (false), primary (false), clustered (false),
          computed (false)
    {
    }

    std::string name;
    std::string type_decl; // As written.
    sql_type type;
    bool null;
    bool identity;
    bool primary;   // Column-level PRIMARY KEY.
    bool clustered; // Clustering of the column-level PRIMARY KEY.
    std::string primary_name;
    bool computed;  // Computed column (AS expression), type is invalid.
    std::string default_;
    location loc;
  };

  // Table constraint or index.
  //
  struct key
  {
    enum kind_type
    {
      primary,
      unique,
      foreign,
      index
    };

    key ()
        : kind (index), clustered (false),
          on_delete (no_action), on_update (no_action)
    {
    }

    bool
    unique_ () const
    {
      return kind == primary || kind == unique;
    }

    kind_type kind;
    std::string name; // Empty if unnamed.
    bool clustered;
    std::vector<std::string> columns;

    // Foreign key.
    //
    qname referenced_table;
    std::vector<std::string> referenced_columns;
    action_type on_delete;
    action_type on_update;

    location loc;
  };

  struct table
  {
    qname name;
    std::vector<column> columns;
    std::vector<key> keys;
    location loc;
  };

  struct view
  {
    qname name;
    std::vector<std::string> columns; // Declared column list, if any.
    std::string query;
    location loc;
  };

  // ALTER TABLE ... ADD constraint or CREATE INDEX.
  //
  struct table_key
  {
    qname table;
    key k;
  };

  struct insert
  {
    qname table;
    std::vector<std::string> columns; // Empty means all in order.
    std::vector<std::vector<literal> > rows;
    location loc;
  };

  struct model
  {
    std::string source;

    std::vector<table> tables;
    std::vector<view> views;
    std::vector<table_key> keys;
    std::vector<insert> inserts;
  };

  typedef std::vector<model> models;
}

#endif // SQLGEN_RAW_MODEL_HXX
