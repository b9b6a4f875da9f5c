// file      : sqlgen/semantics/relational/foreign-key.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX

#include <iosfwd>

#include <sqlgen/semantics/relational/elements.hxx>
#include <sqlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    class table;
    class foreign_key;

    // Resolved foreign key target.
    //
    class references: public edge
    {
    public:
      typedef relational::foreign_key foreign_key_type;
      typedef relational::table table_type;

      foreign_key_type&
      foreign_key () const
      {
        return *foreign_key_;
      }

      table_type&
      table () const
      {
        return *table_;
      }

    public:
      void
      set_left_node (foreign_key_type& n)
      {
        foreign_key_ = &n;
      }

      void
      set_right_node (table_type& n)
      {
        table_ = &n;
      }

    protected:
      foreign_key_type* foreign_key_;
      table_type* table_;
    };

    class foreign_key: public key
    {
    public:
      qname const&
      referenced_table () const
      {
        return referenced_table_;
      }

      typedef std::vector<string> columns;

      // If no columns were specified in the source, then the refiner
      // fills in the referenced table's primary key columns.
      //
      columns const&
      referenced_columns () const
      {
        return referenced_columns_;
      }

      columns&
      referenced_columns ()
      {
        return referenced_columns_;
      }

    public:
      enum action_type
      {
        no_action,
        cascade,
        set_null,
        set_default
      };

      action_type
      on_delete () const
      {
        return on_delete_;
      }

      void
      on_delete (action_type a)
      {
        on_delete_ = a;
      }

      action_type
      on_update () const
      {
        return on_update_;
      }

      void
      on_update (action_type a)
      {
        on_update_ = a;
      }

      // The target table. Only valid once the key has been resolved.
      //
    public:
      bool
      resolved () const
      {
        return references_ != 0;
      }

      references&
      referenced () const
      {
        return *references_;
      }

    public:
      foreign_key (location const& l,
                   bool named_in_source,
                   qname const& referenced_table)
          : key (l, named_in_source),
            referenced_table_ (referenced_table),
            on_delete_ (no_action),
            on_update_ (no_action),
            references_ (0)
      {
      }

      void
      add_edge_left (references& e)
      {
        assert (references_ == 0);
        references_ = &e;
      }

      using key::add_edge_left;

      virtual string
      kind () const
      {
        return "foreign key";
      }

    private:
      qname referenced_table_;
      columns referenced_columns_;
      action_type on_delete_;
      action_type on_update_;

      references* references_;
    };

    std::ostream&
    operator<< (std::ostream&, foreign_key::action_type);
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX
