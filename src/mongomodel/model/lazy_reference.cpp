// lazy_reference.cpp

/*    Copyright 2009 10gen Inc.
 *
 *    Licensed under the Apache License, Version 2.0 (the "License");
 *    you may not use this file except in compliance with the License.
 *    You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 *    Unless required by applicable law or agreed to in writing, software
 *    distributed under the License is distributed on an "AS IS" BASIS,
 *    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *    See the License for the specific language governing permissions and
 *    limitations under the License.
 */

#include "mongomodel/pch.h"
#include "mongomodel/model/lazy_reference.h"

#include "mongomodel/model/model_manager.h"

namespace mongomodel {

    LazyModelInstance::LazyModelInstance( const shared_ptr<const ModelDescriptor>& d , const Value& pk ,
                                          const string& alias )
        : _d( d ) , _pk( pk ) , _alias( alias ) {
        uassert( 16150 , "LazyModelInstance needs a descriptor" , _d );
        uassert( 16151 , "LazyModelInstance needs a primary key" , ! _pk.eoo() && ! _pk.isNull() );
    }

    ModelInstancePtr LazyModelInstance::resolve() {
        if ( ! _wrapped ) {
            LOG(2) << "resolving " << toString() << endl;
            _wrapped = ModelManager( _d , _alias ).getByPk( _pk );
        }
        return _wrapped;
    }

    bool LazyModelInstance::operator==( const LazyModelInstance& other ) const {
        return _d->name() == other._d->name() && _pk == other._pk;
    }

    bool LazyModelInstance::refersTo( const ModelInstance& inst ) {
        return *resolve() == inst;
    }

    string LazyModelInstance::toString() const {
        stringstream ss;
        ss << "Lazy" << _d->name() << "(" << _pk.toString() << ")";
        return ss.str();
    }

    LazyModelInstancePtr lazyInstanceOf( const Value& v ) {
        if ( v.type() != ModelRef )
            return LazyModelInstancePtr();
        return boost::dynamic_pointer_cast<LazyModelInstance>( v.referent() );
    }

}
