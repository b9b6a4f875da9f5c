// file      : sqlgen/semantics/relational/table.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_TABLE_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_TABLE_HXX

#include <vector>

#include <sqlgen/literal.hxx>
#include <sqlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class references;
    class primary_key;

    class table: public nameable, public scope
    {
      typedef std::vector<references*> referenced_list;

    public:
      // Qualified name. The name in the model scope is its string
      // representation.
      //
      qname const&
      qualified_name () const
      {
        return qname_;
      }

      // Primary key or NULL if there is none.
      //
      primary_key*
      primary () const;

      // Rows inserted with INSERT ... VALUES. Each row has one value per
      // column in the column order; omitted columns are NULL.
      //
    public:
      typedef std::vector<literal> row;
      typedef std::vector<row> rows_type;

      rows_type const&
      rows () const
      {
        return rows_;
      }

      void
      add_row (row const& r)
      {
        rows_.push_back (r);
      }

      // Foreign keys that reference this table.
      //
    public:
      typedef
      pointer_iterator<referenced_list::const_iterator>
      referenced_iterator;

      referenced_iterator
      referenced_begin () const
      {
        return referenced_.begin ();
      }

      referenced_iterator
      referenced_end () const
      {
        return referenced_.end ();
      }

    public:
      table (location const& l, qname const& n): nameable (l), qname_ (n) {}

      void
      add_edge_right (references& e)
      {
        referenced_.push_back (&e);
      }

      using nameable::add_edge_right;

      virtual string
      kind () const {return "table";}

      // Resolve ambiguity.
      //
      using nameable::scope;

    private:
      qname qname_;
      rows_type rows_;
      referenced_list referenced_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_TABLE_HXX
