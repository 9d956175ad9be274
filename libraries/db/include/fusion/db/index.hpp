/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <fusion/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/raw.hpp>

#include <fstream>
#include <functional>
#include <iterator>

namespace fusion { namespace db {

   class object_database;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a sequential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    *
    *  Items in an index can only be modified via a call to modify and
    *  all references to objects outside of an index are constant references.
    *
    *  Each index stores its own objects.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         virtual const object&  load( const std::vector<char>& data ) = 0;

         /**
          * Polymorphically insert by moving an object into the index.
          * this should throw if the object is already in the database.
          */
         virtual const object& insert( object&& obj ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Opens the index loading objects from a file
          */
         virtual void open( const fc::path& db ) = 0;
         virtual void save( const fc::path& db ) = 0;

         /** @return the object with id or nullptr if not found */
         virtual const object* find( object_id_type id )const = 0;

         /**
          * This version will automatically check for nullptr and throw an exception if the
          * object ID could not be found.
          */
         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object ${id}", ("id",std::string(id)) );
            return *maybe_found;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

   /**
    * @brief Connects a concrete index to the object_database so that every change is recorded by the
    * undo_database before it happens.
    */
   class base_primary_index
   {
      public:
         explicit base_primary_index( object_database& db ) : _db(db) {}

         /** called just before obj is modified */
         void save_undo( const object& obj );

         /** called just after the object is added */
         void on_add( const object& obj );

         /** called just before obj is removed */
         void on_remove( const object& obj );

      protected:
         object_database& _db;
   };

   /**
    * @brief Wraps a DerivedIndex to record undo state and keep track of the next id
    *
    * Objects are persisted as a sequence of packed vector<char>, preceded by the next id, so that ids
    * are never reused across restarts.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         using object_type = typename DerivedIndex::object_type;

         explicit primary_index( object_database& db )
         :base_primary_index(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         uint8_t object_space_id()const override { return object_type::space_id; }
         uint8_t object_type_id()const override  { return object_type::type_id; }

         object_id_type get_next_id()const override { return _next_id; }
         void           use_next_id() override      { ++_next_id.number; }
         void           set_next_id( object_id_type id ) override { _next_id = id; }

         void open( const fc::path& db ) override
         {
            if( !fc::exists( db ) ) return;
            std::ifstream in( db.generic_string(), std::ios::binary );
            FC_ASSERT( in, "Unable to open ${f}", ("f",db.generic_string()) );
            std::vector<char> data( (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>() );
            fc::datastream<const char*> ds( data.data(), data.size() );
            fc::raw::unpack( ds, _next_id );
            while( ds.remaining() )
            {
               std::vector<char> tmp;
               fc::raw::unpack( ds, tmp );
               load( tmp );
            }
         }

         void save( const fc::path& db ) override
         {
            std::ofstream out( db.generic_string(),
                               std::ofstream::binary | std::ofstream::out | std::ofstream::trunc );
            FC_ASSERT( out, "Unable to write ${f}", ("f",db.generic_string()) );
            auto packed_id = fc::raw::pack( _next_id );
            out.write( packed_id.data(), packed_id.size() );
            this->inspect_all_objects( [&out]( const object& o ) {
               auto packed = fc::raw::pack( fc::raw::pack( static_cast<const object_type&>(o) ) );
               out.write( packed.data(), packed.size() );
            });
         }

         const object& load( const std::vector<char>& data ) override
         {
            object_type obj;
            fc::datastream<const char*> ds( data.data(), data.size() );
            fc::raw::unpack( ds, obj );
            return DerivedIndex::insert( std::move( obj ) );
         }

         const object& insert( object&& obj ) override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_add( result );
            return result;
         }

         const object& create( const std::function<void(object&)>& constructor ) override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         object_id_type _next_id;
   };

} } // fusion::db
