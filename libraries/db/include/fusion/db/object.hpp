/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.  All rights reserved.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 */
#pragma once
#include <fusion/protocol/object_id.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>
#include <vector>

namespace fusion { namespace db {

   using std::unique_ptr;
   using std::vector;
   using fc::variant;

   /**
    *  @brief base for all database objects
    *
    *  The object is the level at which undo operations are performed. Each object is assigned a unique and
    *  sequential id by the index that stores it, within the space and type declared by the derived class.
    *
    *  All objects must be serializable via FC_REFLECT() and copy-constructable, and should refer to other
    *  objects by id only.
    *
    *  @note Do not use multiple inheritance with object because the code assumes a static_cast will work
    *  between object and derived types.
    */
   class object
   {
      public:
         object() = default;
         object( uint8_t space_id, uint8_t type_id ) : id( space_id, type_id, 0 ) {}
         virtual ~object() = default;

         // serialized
         object_id_type          id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const = 0;
         virtual vector<char>       pack()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Use the Curiously Recurring Template Pattern to automatically add the ability to
    *  clone, serialize, and move objects polymorphically.
    */
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         using id_type = object_id<SpaceID, TypeID>;
         static constexpr uint8_t space_id = SpaceID;
         static constexpr uint8_t type_id = TypeID;

         abstract_object() : object( SpaceID, TypeID ) {}

         id_type get_id()const { return id_type( this->id ); }

         unique_ptr<object> clone()const override
         {
            return unique_ptr<object>( new DerivedClass( *static_cast<const DerivedClass*>(this) ) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         variant to_variant()const override { return variant( static_cast<const DerivedClass&>(*this), 32 ); }
         vector<char> pack()const override  { return fc::raw::pack( static_cast<const DerivedClass&>(*this) ); }
   };

} } // fusion::db

FC_REFLECT( fusion::db::object, (id) )
