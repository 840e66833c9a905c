// testmodels.cpp : the models the suites read and write.
//

/**
*    Copyright (C) 2008 10gen Inc.
*
*    This program is free software: you can redistribute it and/or  modify
*    it under the terms of the GNU Affero General Public License, version 3,
*    as published by the Free Software Foundation.
*
*    This program is distributed in the hope that it will be useful,
*    but WITHOUT ANY WARRANTY; without even the implied warranty of
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*    GNU Affero General Public License for more details.
*
*    You should have received a copy of the GNU Affero General Public License
*    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "mongomodel/pch.h"
#include "mongomodel/dbtests/dbtests.h"

namespace mongomodel {
    namespace dbtests {

        void registerTestModels() {
            Schema& s = Schema::global();

            s.registerModel( ModelDescriptorBuilder( "RawModel" )
                             .field( FieldDescriptor( "raw" , RawField ) )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "DateModel" )
                             .field( FieldDescriptor( "date" , DateField ) )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "Entry" )
                             .field( FieldDescriptor( "title" , CharField ) )
                             .field( FieldDescriptor( "views" , IntegerField ).defaultValue( Value( 0 ) ) )
                             .field( FieldDescriptor( "published" , BooleanField ) )
                             .field( FieldDescriptor( "tags" , ListField ) )
                             .field( FieldDescriptor( "meta" , DictField ) )
                             .field( FieldDescriptor( "author" , ForeignKey ).to( "RawModel" ) )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "DescendingIndexModel" )
                             .field( FieldDescriptor( "desc" , IntegerField ).dbIndex() )
                             .descendingIndex( "desc" )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "IndexTestModel" )
                             .field( FieldDescriptor( "regular_index" , IntegerField ).dbIndex() )
                             .field( FieldDescriptor( "custom_column" , IntegerField ).dbColumn( "foo" ).dbIndex() )
                             .field( FieldDescriptor( "custom_column2" , IntegerField ).dbColumn( "spam" ).dbIndex() )
                             .field( FieldDescriptor( "foreignkey_index" , ForeignKey ).to( "RawModel" ).dbIndex() )
                             .field( FieldDescriptor( "sparse_index" , IntegerField ).dbIndex().sparse() )
                             .field( FieldDescriptor( "sparse_index_unique" , IntegerField ).dbIndex().sparse().unique() )
                             .field( FieldDescriptor( "sparse_index_cmp_1" , IntegerField ) )
                             .field( FieldDescriptor( "sparse_index_cmp_2" , IntegerField ) )
                             .field( FieldDescriptor( "descending_index" , IntegerField ).dbIndex() )
                             .field( FieldDescriptor( "descending_custom_column" , IntegerField ).dbColumn( "bar" ).dbIndex() )
                             .descendingIndex( "descending_index" )
                             .descendingIndex( "descending_custom_column" )
                             .index( IndexSpec().on( "regular_index" ).on( "custom_column" ) )
                             .index( IndexSpec().on( "sparse_index_cmp_1" ).on( "sparse_index_cmp_2" ).sparse() )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "IndexTestModel2" )
                             .field( FieldDescriptor( "a" , IntegerField ) )
                             .field( FieldDescriptor( "b" , IntegerField ) )
                             .index( IndexSpec().on( "a" ).on( "b" , -1 ) )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "GridFSFieldTestModel" )
                             .field( FieldDescriptor( "gridfile" , GridFSField ) )
                             .field( FieldDescriptor( "gridfile_versioned" , GridFSField ).versioning() )
                             .field( FieldDescriptor( "gridfile_nodelete" , GridFSField ).autodelete( false ) )
                             .field( FieldDescriptor( "gridstring" , GridFSStringField ) )
                             .done() );

            s.registerModel( ModelDescriptorBuilder( "Site" )
                             .collection( "django_site" )
                             .field( FieldDescriptor( "domain" , CharField ) )
                             .field( FieldDescriptor( "name" , CharField ) )
                             .idHint( "SITE_ID" )
                             .done() );
        }

    }
}
