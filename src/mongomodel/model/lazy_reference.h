// lazy_reference.h

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

#pragma once

#include "mongomodel/model/model_instance.h"

namespace mongomodel {

    /**
       a (model, primary key) pair standing in for a record that has not been read.
       the first get() reads it through the manager of the connection alias and
       keeps it; comparing two references never reads anything.
     */
    class LazyModelInstance : public Referent {
    public:
        LazyModelInstance( const shared_ptr<const ModelDescriptor>& d , const Value& pk ,
                           const string& alias = "default" );

        const ModelDescriptor& descriptor() const { return *_d; }
        const Value& pk() const { return _pk; }

        bool isResolved() const { return _wrapped.get() != 0; }

        /** null until resolved */
        ModelInstancePtr wrapped() const { return _wrapped; }

        /** reads the record once.  raises DoesNotExist if it is gone. */
        ModelInstancePtr resolve();

        Value get( const string& field ) { return resolve()->get( field ); }

        bool operator==( const LazyModelInstance& other ) const;
        bool operator!=( const LazyModelInstance& other ) const { return ! ( *this == other ); }

        /** resolves, then compares with inst */
        bool refersTo( const ModelInstance& inst );

        virtual string toString() const;

    private:
        shared_ptr<const ModelDescriptor> _d;
        Value _pk;
        string _alias;
        ModelInstancePtr _wrapped;
    };

    typedef shared_ptr<LazyModelInstance> LazyModelInstancePtr;

    /** the LazyModelInstance a ModelRef Value wraps, null if it wraps something else */
    LazyModelInstancePtr lazyInstanceOf( const Value& v );

}
