// file      : sqlgen/semantics/relational/column.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX

#include <cstddef> // std::size_t

#include <sqlgen/sql-type.hxx>
#include <sqlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class contains;

    class column: public nameable
    {
      typedef std::vector<contains*> contained_list;

    public:
      // Parsed type. View columns declared without a type have the
      // invalid core type.
      //
      sql_type const&
      type () const {return type_;}

      // Type declaration as written in the source.
      //
      string const&
      type_decl () const {return type_decl_;}

      bool
      null () const {return null_;}

      void
      null (bool n) {null_ = n;}

      bool
      identity () const {return identity_;}

      void
      identity (bool i) {identity_ = i;}

      // Primary key membership. Set from the column-level PRIMARY KEY
      // and normalized by the refiner.
      //
      bool
      primary () const {return primary_;}

      void
      primary (bool p) {primary_ = p;}

      string const&
      default_ () const {return default__;}

      void
      default_ (string const& d) {default__ = d;}

      // Zero-based position in the owning table or view.
      //
      std::size_t
      ordinal () const {return ordinal_;}

      // Key containment.
      //
    public:
      typedef
      pointer_iterator<contained_list::const_iterator>
      contained_iterator;

      contained_iterator
      contained_begin () const {return contained_.begin ();}

      contained_iterator
      contained_end () const {return contained_.end ();}

    public:
      column (location const& l,
              std::size_t ordinal,
              string const& type_decl,
              sql_type const& type)
          : nameable (l),
            type_ (type),
            type_decl_ (type_decl),
            null_ (true),
            identity_ (false),
            primary_ (false),
            ordinal_ (ordinal)
      {
      }

      void
      add_edge_right (contains& e)
      {
        contained_.push_back (&e);
      }

      using nameable::add_edge_right;

      virtual string
      kind () const
      {
        return "column";
      }

    private:
      sql_type type_;
      string type_decl_;
      bool null_;
      bool identity_;
      bool primary_;
      string default__;
      std::size_t ordinal_;

      contained_list contained_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX
