#ifndef CASTORLOCALDEFS_H
#define CASTORLOCALDEFS_H

#define CASTOR_MAIN_THREAD  QString("MainLoop")

// setting prefixes
#define CASTOR_CORE                QString("CORE_")
#define CASTOR_DLNA                QString("DLNA_")

// settings
#define CASTOR_SETTING_PORT        (CASTOR_CORE + "ApplicationPort")
#define CASTOR_SETTING_NAME        (CASTOR_DLNA + "FriendlyName")
#define CASTOR_SETTING_USN         (CASTOR_DLNA + "USN")
#define CASTOR_SETTING_BLOCKED     (CASTOR_CORE + "BlockedInterfaces")
#define CASTOR_SETTING_ADDITIONAL  (CASTOR_CORE + "AdditionalInterfaces")

// SSDP
#define CASTOR_SSDP_GROUP          QString("239.255.255.250")
#define CASTOR_SSDP_PORT           1900
#define CASTOR_SSDP_CACHE_CONTROL  QString("max-age=66")
#define CASTOR_SSDP_DEFAULT_MX     3
#define CASTOR_SSDP_MAXIMUM_MX     5

// event bus topics
#define CASTOR_TOPIC_SSDP_NOTIFY      QString("ssdp_notify")
#define CASTOR_TOPIC_SSDP_UPDATE_IP   QString("ssdp_update_ip")
#define CASTOR_TOPIC_RELOAD_RENDERER  QString("reload_renderer")
#define CASTOR_TOPIC_GET_RENDERER     QString("get_renderer")
#define CASTOR_TOPIC_SET_RENDERER     QString("set_renderer")
#define CASTOR_TOPIC_RELOAD_PROTOCOL  QString("reload_protocol")
#define CASTOR_TOPIC_GET_PROTOCOL     QString("get_protocol")
#define CASTOR_TOPIC_SET_PROTOCOL     QString("set_protocol")
#define CASTOR_TOPIC_RENDERER_AV_STOP QString("renderer_av_stop")

#endif // CASTORLOCALDEFS_H
