#pragma once
#include <pari/chain/exceptions.hpp>
#include <pari/chain/operations.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <map>
#include <memory>

namespace pari { namespace chain {

   /**
    *  Maps every operation_type_enum to the concrete operation struct so a
    *  packed operation can be evaluated or shown as json.  Operations are
    *  registered once, in operations.cpp.
    */
   class operation_factory
   {
       public:
          static operation_factory& instance();

          class operation_handler_base
          {
             public:
                  virtual ~operation_handler_base(){}
                  virtual void unpack_to_variant( const operation& in, fc::variant& out )const = 0;
                  virtual void pack_from_variant( const fc::variant& data, operation& out )const = 0;
                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op )const = 0;
          };

          template<typename OperationType>
          class operation_handler : public operation_handler_base
          {
             public:
                  virtual void unpack_to_variant( const operation& in, fc::variant& out )const override
                  {
                     out = fc::variant( in.as<OperationType>() );
                  }

                  virtual void pack_from_variant( const fc::variant& data, operation& out )const override
                  { try {
                     out = operation( data.as<OperationType>() );
                  } FC_RETHROW_EXCEPTIONS( warn, "unable to read ${type}", ("type",fc::get_typename<OperationType>::name()) ) }

                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op )const override
                  {
                     op.as<OperationType>().evaluate( eval_state );
                  }
          };

          template<typename OperationType>
          void register_operation()
          {
             if( _handlers.count( OperationType::type ) )
                FC_THROW_EXCEPTION( unsupported_chain_operation, "operation type ${t} registered twice", ("t",OperationType::type) );
             _handlers[ OperationType::type ] = std::make_shared< operation_handler<OperationType> >();
          }

          void evaluate( transaction_evaluation_state& eval_state, const operation& op )const;

          /** {"type":<name>,"data":<fields>} */
          void to_variant( const operation& in, fc::variant& output )const;
          void from_variant( const fc::variant& in, operation& output )const;

       private:
          const operation_handler_base& get_handler( const operation_type_enum type )const;

          std::map<operation_type_enum, std::shared_ptr<operation_handler_base> > _handlers;
   };

} } // pari::chain
