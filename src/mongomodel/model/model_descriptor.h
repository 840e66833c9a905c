// model_descriptor.h

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

#include "mongomodel/model/field.h"

namespace mongomodel {

    /** a declared compound index: (field, direction) pairs in declaration order */
    class IndexSpec {
    public:
        IndexSpec() : _unique( false ) , _sparse( false ) { }

        /** @param direction 1 ascending, -1 descending */
        IndexSpec& on( const string& field , int direction = 1 ) {
            _fields.push_back( make_pair( field , direction ) );
            return *this;
        }
        IndexSpec& unique( bool on = true ) { _unique = on; return *this; }
        IndexSpec& sparse( bool on = true ) { _sparse = on; return *this; }

        const vector< pair<string,int> >& fields() const { return _fields; }
        bool isUnique() const { return _unique; }
        bool isSparse() const { return _sparse; }

    private:
        vector< pair<string,int> > _fields;
        bool _unique;
        bool _sparse;
    };

    /**
       everything the library knows about one model type.  immutable, made by
       ModelDescriptorBuilder::done().
     */
    class ModelDescriptor : boost::noncopyable {
    public:
        const string& name() const { return _name; }
        const string& collection() const { return _collection; }

        const vector<FieldDescriptor>& fields() const { return _fields; }

        /** by field name, "pk" names the primary key.  @return 0 if unknown */
        const FieldDescriptor* field( const string& name ) const;

        /** by storage column.  @return 0 if unknown */
        const FieldDescriptor* fieldByColumn( const string& column ) const;

        const FieldDescriptor& pk() const { return _fields[_pk]; }

        const vector<IndexSpec>& indexes() const { return _indexes; }

        /** whether the single field index of field is descending */
        bool isDescending( const string& field ) const;

        /** setting name quoted in invalid primary key errors, e.g. "SITE_ID".  may be empty. */
        const string& idHint() const { return _idHint; }

        bool hasGridFSFields() const;

        string toString() const;

    private:
        friend class ModelDescriptorBuilder;
        ModelDescriptor() : _pk( 0 ) { }

        string _name;
        string _collection;
        vector<FieldDescriptor> _fields;
        unsigned _pk;
        vector<IndexSpec> _indexes;
        vector<string> _descendingIndexes;
        string _idHint;
    };

    /**
         shared_ptr<const ModelDescriptor> post = ModelDescriptorBuilder( "Post" )
             .field( FieldDescriptor( "title" , CharField ).dbIndex() )
             .field( FieldDescriptor( "date" , DateTimeField ) )
             .index( IndexSpec().on( "title" ).on( "date" , -1 ) )
             .done();

       a model without a primary key gets an AutoField "id" in front.
       the collection defaults to the lower cased model name.
     */
    class ModelDescriptorBuilder {
    public:
        ModelDescriptorBuilder( const string& name );

        ModelDescriptorBuilder& collection( const string& name );
        ModelDescriptorBuilder& field( const FieldDescriptor& f );
        ModelDescriptorBuilder& index( const IndexSpec& spec );
        ModelDescriptorBuilder& descendingIndex( const string& field );
        ModelDescriptorBuilder& idHint( const string& setting );

        /** validates and returns the descriptor.  the builder should not be used after. */
        shared_ptr<const ModelDescriptor> done();

    private:
        shared_ptr<ModelDescriptor> _d;
    };

    /** name -> descriptor, for foreign keys, references and the tools.  thread safe. */
    class Schema : boost::noncopyable {
    public:
        static Schema& global();

        /** replaces a model of the same name */
        shared_ptr<const ModelDescriptor> registerModel( const shared_ptr<const ModelDescriptor>& d );

        /** uasserts if name is unknown */
        shared_ptr<const ModelDescriptor> get( const string& name );

        bool has( const string& name );

        /** in registration order */
        vector< shared_ptr<const ModelDescriptor> > all();

        void clear();

    private:
        Schema() { }

        mongomodel::mutex _m;
        vector< shared_ptr<const ModelDescriptor> > _models;
    };

}
