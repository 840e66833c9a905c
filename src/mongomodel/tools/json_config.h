/*
 *    Copyright (C) 2010 10gen Inc.
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

// json_config.h

#pragma once

#include "mongomodel/client/connection.h"
#include "mongomodel/model/model_descriptor.h"

namespace mongomodel {

    /**
       { "HOST" : "localhost" , "PORT" : 27017 , "NAME" : "blog" , "USER" : "" ,
         "PASSWORD" : "" , "DRIVER" : "mongodb" , "DEBUG" : false ,
         "AUTOMATIC_REFERENCING" : false , "OPTIONS" : { ... } }

       missing keys keep the ConnectionSettings defaults.
     */
    ConnectionSettings settingsFromJson( istream& in );
    ConnectionSettings loadSettingsFile( const string& fileName );

    /**
       { "models" : [ { "name" : "Post" , "collection" : "blog_post" ,
                        "descending_indexes" : [ "date" ] , "id_hint" : "" ,
                        "fields" : [ { "name" : "title" , "type" : "CharField" ,
                                       "db_index" : true , "db_column" : "t" ,
                                       "unique" : false , "sparse" : false ,
                                       "primary_key" : false , "to" : "" ,
                                       "versioning" : false , "autodelete" : true } ] ,
                        "indexes" : [ { "fields" : [ [ "title" , 1 ] , [ "date" , -1 ] ] ,
                                        "unique" : false , "sparse" : false } ] } ] }

       the models are registered with Schema::global() and returned in file order.
     */
    vector< shared_ptr<const ModelDescriptor> > schemaFromJson( istream& in );
    vector< shared_ptr<const ModelDescriptor> > loadSchemaFile( const string& fileName );

}
