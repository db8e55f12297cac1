#define THEMES(X) \
  X("default", theme_default)\
  X("mono", theme_mono)\


static const char* theme_default =
  #include "./themes/default.json.inl"
;

static const char* theme_mono =
  #include "./themes/mono.json.inl"
;
