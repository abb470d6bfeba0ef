//
//  constants.hpp
//  ContactSync
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//

#ifndef constants_h
#define constants_h

#include <string>

#define FS_PATH_SEP "/"

// Configuration

static const std::string CONFIG_DIR_ENV = "CONTACTS_DIR";
static const std::string CONFIG_DIR_DEFAULT_SUFFIX = "/.config/contacts";
static const std::string LOG_LEVEL_ENV = "CONTACTSYNC_LOG_LEVEL";
static const std::string CONTACTS_SUBDIR = "people";
static const std::string CONTACT_FILE_EXT = ".vcf";
static const std::string CREDENTIALS_FILENAME = "google_creds.json";
static const std::string SYNC_TOKEN_FILENAME = "google_sync_token.txt";
static const std::string LOG_FILENAME = "contactsync.log";

// Google OAuth

static const std::string GOOGLE_AUTH_URL = "https://accounts.google.com/o/oauth2/auth";
static const std::string GOOGLE_TOKEN_URL = "https://oauth2.googleapis.com/token";
static const std::string GOOGLE_OAUTH_SCOPES = "https://www.googleapis.com/auth/contacts https://www.googleapis.com/auth/userinfo.email";
static const std::string OAUTH_CALLBACK_HOST = "localhost";
static const std::string OAUTH_LISTEN_ADDRESS = "127.0.0.1";
static const std::string OAUTH_CALLBACK_PATH = "/callback";
static const int OAUTH_REDIRECT_PORT = 8080;

// Google People API

static const std::string GOOGLE_PEOPLE_ROOT = "https://people.googleapis.com/v1/";
static const std::string GOOGLE_RESOURCE_PREFIX = "people/";
static const std::string PERSON_FIELDS = "addresses,ageRanges,biographies,birthdays,calendarUrls,clientData,coverPhotos,emailAddresses,events,externalIds,genders,imClients,interests,locales,locations,memberships,metadata,miscKeywords,names,nicknames,occupations,organizations,phoneNumbers,photos,relations,sipAddresses,skills,urls,userDefined";
static const std::string PERSON_UPDATE_FIELDS = "names,phoneNumbers,emailAddresses,addresses,organizations,birthdays,biographies,urls";
static const int PEOPLE_PAGE_SIZE = 1000;
static const std::string PEOPLE_READ_SOURCES = "READ_SOURCE_TYPE_CONTACT";

// vCard properties ContactSync writes outside of the standard set

static const std::string VCARD_VERSION = "4.0";
static const std::string PROP_ETAG = "X-GOOGLE-ETAG";
static const std::string PROP_RESOURCE_NAME = "X-GOOGLE-RESOURCE-NAME";
static const std::string PROP_LAST_SYNCED = "X-LAST-SYNCED";

static const std::string EXT_EVENT = "X-GOOGLE-EVENT";
static const std::string EXT_INTEREST = "X-GOOGLE-INTEREST";
static const std::string EXT_SKILL = "X-GOOGLE-SKILL";
static const std::string EXT_OCCUPATION = "X-GOOGLE-OCCUPATION";
static const std::string EXT_LOCATION = "X-GOOGLE-LOCATION";
static const std::string EXT_GROUP_MEMBERSHIP = "X-GOOGLE-GROUP-MEMBERSHIP";
static const std::string EXT_CUSTOM_PREFIX = "X-GOOGLE-CUSTOM-";
static const std::string EXT_CLIENT_PREFIX = "X-GOOGLE-CLIENT-";
static const std::string EXT_EXTERNAL_ID = "X-GOOGLE-EXTERNAL-ID";
static const std::string EXT_KEYWORD = "X-GOOGLE-KEYWORD";
static const std::string EXT_COVER_PHOTO = "X-GOOGLE-COVER-PHOTO";
static const std::string EXT_AGE_RANGE = "X-GOOGLE-AGE-RANGE";
static const std::string EXT_SOURCE = "X-GOOGLE-SOURCE";

#endif /* constants_h */
